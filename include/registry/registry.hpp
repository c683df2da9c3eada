#pragma once
#include "core/types.hpp"
#include <optional>
#include <set>
#include <map>
#include <string>

// Identity verification and asset ownership lookups.
class Registry {
public:
  virtual ~Registry() = default;
  virtual bool IsVerified(const Identity& identity) = 0;
  virtual std::optional<Identity> GetAssetOwner(std::uint64_t asset_id) = 0;
};

// Registry backed by a JSON document:
//   {"verified": ["alice", ...], "assets": {"1": "alice", ...}}
class JsonRegistry : public Registry {
public:
  JsonRegistry() = default;
  // Throws std::runtime_error if the file cannot be read or is not the expected shape.
  static JsonRegistry FromFile(const std::string& path);
  static JsonRegistry FromString(const std::string& document);

  bool IsVerified(const Identity& identity) override;
  std::optional<Identity> GetAssetOwner(std::uint64_t asset_id) override;

  void Verify(const Identity& identity) { verified_.insert(identity); }
  void Revoke(const Identity& identity) { verified_.erase(identity); }
  void SetAssetOwner(std::uint64_t asset_id, const Identity& owner) { assets_[asset_id] = owner; }
private:
  std::set<Identity> verified_;
  std::map<std::uint64_t, Identity> assets_;
};
