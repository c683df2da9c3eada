#pragma once
#include "core/types.hpp"
#include <string>
#include <unordered_map>
#include <optional>
#include <mutex>
#include <memory>

// Per-currency unit price lookup. `oracle` is the identity bound to the currency in the vault.
class PriceOracle {
public:
  virtual ~PriceOracle() = default;
  // Unit price of `currency` for a position of `amount`; nullopt if the oracle cannot answer.
  virtual std::optional<Amount> GetPrice(const std::string& oracle, const std::string& currency, Amount amount) = 0;
};

// Prices from configuration: PRICE_OVERRIDES=CUR:price,... Unknown currencies have no price.
class StaticPriceOracle : public PriceOracle {
public:
  StaticPriceOracle() = default;
  static std::unique_ptr<StaticPriceOracle> FromConfig();
  std::optional<Amount> GetPrice(const std::string& oracle, const std::string& currency, Amount amount) override;
  void SetPrice(const std::string& currency, Amount price);
private:
  std::unordered_map<std::string, Amount> prices_;
  std::mutex mutex_;
};
