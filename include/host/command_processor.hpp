#pragma once
#include "core/types.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <string>
#include <vector>

class LendingHost;

// JSON-lines front end of the host.
//   request:  {"op": "...", "caller": "...", ...arguments}
//   response: {"ok": true, "result": ...} | {"ok": false, "error": {"code", "kind", "message"}}
class CommandProcessor {
public:
  explicit CommandProcessor(LendingHost& host);
  // Never throws; malformed input becomes an error response.
  std::string HandleLine(const std::string& line);
  nlohmann::json Handle(const nlohmann::json& command);
  std::vector<std::string> Operations() const;
private:
  using Handler = std::function<nlohmann::json(const nlohmann::json&)>;
  void RegisterVaultOps();
  void RegisterLoanOps();
  void RegisterPoolOps();
  void RegisterHostOps();
  void RegisterQueries();
  // Registers a state-changing op that runs as one host transaction.
  void Mutation(const std::string& op, std::function<nlohmann::json(const nlohmann::json&, const CallContext&)> fn);

  LendingHost& host_;
  std::map<std::string, Handler> handlers_;
};
