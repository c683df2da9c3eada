#pragma once
#include "oracle/price_oracle.hpp"
#include <string>

class HttpClient;

// Asks a remote price feed: POST {"oracle","currency","amount"} -> {"price": n}.
// Any transport, status or parse problem yields no price.
class HttpPriceOracle : public PriceOracle {
public:
  HttpPriceOracle(HttpClient& http, std::string endpoint, int timeout_ms = 2000);
  std::optional<Amount> GetPrice(const std::string& oracle, const std::string& currency, Amount amount) override;
private:
  HttpClient& http_;
  std::string endpoint_;
  int timeout_ms_;
};
