#include "oracle/price_oracle.hpp"
#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include <stdexcept>

std::unique_ptr<StaticPriceOracle> StaticPriceOracle::FromConfig() {
  std::unique_ptr<StaticPriceOracle> oracle(new StaticPriceOracle());
  for (const auto& kv : ConfigManager::GetPairs("PRICE_OVERRIDES")) {
    try {
      oracle->SetPrice(kv.first, static_cast<Amount>(std::stoull(kv.second)));
    } catch (const std::logic_error&) {
      Logger::Warning("ignoring bad price override " + kv.first + ":" + kv.second);
    }
  }
  return oracle;
}

std::optional<Amount> StaticPriceOracle::GetPrice(const std::string& oracle, const std::string& currency, Amount amount) {
  (void)oracle; (void)amount;
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = prices_.find(currency);
  if (it == prices_.end()) return std::nullopt;
  return it->second;
}

void StaticPriceOracle::SetPrice(const std::string& currency, Amount price) {
  std::lock_guard<std::mutex> lock(mutex_);
  prices_[currency] = price;
}
