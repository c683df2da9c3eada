#include "oracle/http_price_oracle.hpp"
#include "net/http_client.hpp"
#include "common/logger.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

HttpPriceOracle::HttpPriceOracle(HttpClient& http, std::string endpoint, int timeout_ms)
  : http_(http), endpoint_(std::move(endpoint)), timeout_ms_(timeout_ms) {}

std::optional<Amount> HttpPriceOracle::GetPrice(const std::string& oracle, const std::string& currency, Amount amount) {
  json req = { {"oracle", oracle}, {"currency", currency}, {"amount", amount} };
  auto resp = http_.Post(endpoint_, req.dump(), { {"Content-Type", "application/json"} }, timeout_ms_);
  if (!resp.error.empty() || resp.status != 200) {
    Logger::Warning("price feed " + endpoint_ + " unavailable for " + currency + " (status " + std::to_string(resp.status) + ")");
    return std::nullopt;
  }
  try {
    auto j = json::parse(resp.body);
    if (!j.contains("price") || !j["price"].is_number_unsigned()) {
      Logger::Warning("price feed answered without an unsigned price for " + currency);
      return std::nullopt;
    }
    return j["price"].get<Amount>();
  } catch (const json::exception& e) {
    Logger::Warning(std::string("price feed returned malformed JSON: ") + e.what());
    return std::nullopt;
  }
}
