#pragma once
#include <string>
#include <unordered_map>
#include <optional>
#include <cstdint>
#include <vector>
#include <utility>

// Process-wide KEY=VALUE configuration loaded from an env file.
class ConfigManager {
public:
  static void Initialize(const std::string& env_path = ".env");
  static void Clear();
  static void Set(const std::string& key, const std::string& value);
  static std::optional<std::string> Get(const std::string& key);
  static std::string GetOrThrow(const std::string& key);
  static int GetIntOr(const std::string& key, int default_value);
  static std::uint64_t GetUint64Or(const std::string& key, std::uint64_t default_value);
  static bool GetBoolOr(const std::string& key, bool default_value);
  // "a:1,b:2" -> {("a","1"), ("b","2")}; entries without ':' are skipped.
  static std::vector<std::pair<std::string, std::string>> GetPairs(const std::string& key);
  static std::vector<std::string> GetList(const std::string& key);
private:
  static std::unordered_map<std::string, std::string> cache_;
  static void LoadEnvFile(const std::string& env_path);
};
