#include "common/logger.hpp"
#include "common/config_manager.hpp"
#include "config/protocol_config.hpp"
#include "host/lending_host.hpp"
#include "host/command_processor.hpp"
#include "net/http_client.hpp"
#include "oracle/price_oracle.hpp"
#include "oracle/http_price_oracle.hpp"
#include "telemetry/structured_logger.hpp"
#include <iostream>
#include <memory>
#include <string>

// microlendd [env-file]
// Reads one JSON command per line from stdin and answers one JSON line per command on stdout.
int main(int argc, char** argv) {
  const std::string env_path = argc > 1 ? argv[1] : ".env";
  try {
    ConfigManager::Initialize(env_path);
    Logger::Initialize(ConfigManager::Get("LOG_FILE").value_or("microlend.log"),
                       ParseLogLevel(ConfigManager::Get("LOG_LEVEL").value_or("info")),
                       ConfigManager::GetBoolOr("LOG_STDERR", false));
    Logger::Info("microlendd starting with " + env_path);

    ProtocolConfig config = LoadProtocolConfig();
    StructuredLogger::Instance().Initialize(config.host.event_log_file);

    std::unique_ptr<HttpClient> http;
    std::unique_ptr<PriceOracle> oracle;
    if (!config.host.oracle_url.empty()) {
      http = CreateCurlHttpClient();
      oracle.reset(new HttpPriceOracle(*http, config.host.oracle_url, config.host.oracle_timeout_ms));
      Logger::Info("prices from " + config.host.oracle_url);
    } else {
      oracle = StaticPriceOracle::FromConfig();
      Logger::Info("prices from PRICE_OVERRIDES");
    }

    LendingHost host(config, *oracle);
    CommandProcessor processor(host);

    std::string line;
    std::size_t handled = 0;
    while (std::getline(std::cin, line)) {
      if (line.empty()) continue;
      std::cout << processor.HandleLine(line) << std::endl;
      ++handled;
    }

    Logger::Info("stdin closed after " + std::to_string(handled) + " commands at height " + std::to_string(host.CurrentHeight()));
    StructuredLogger::Instance().Shutdown();
    Logger::Shutdown();
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "microlendd: " << e.what() << std::endl;
    Logger::Critical(std::string("startup failed: ") + e.what(), __FILE__, __LINE__);
    StructuredLogger::Instance().Shutdown();
    Logger::Shutdown();
    return 1;
  }
}
