#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

std::unordered_map<std::string, std::string> ConfigManager::cache_;

static inline std::string TrimWhitespace(const std::string& input) {
  auto start = input.begin();
  while (start != input.end() && std::isspace(static_cast<unsigned char>(*start))) ++start;
  auto end = input.end();
  while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) --end;
  return std::string(start, end);
}

void ConfigManager::Initialize(const std::string& env_path) {
  cache_.clear();
  LoadEnvFile(env_path);
}

void ConfigManager::Clear() { cache_.clear(); }

void ConfigManager::Set(const std::string& key, const std::string& value) { cache_[key] = value; }

void ConfigManager::LoadEnvFile(const std::string& env_path) {
  std::ifstream file(env_path);
  if (!file.is_open()) {
    Logger::Warning("env file not found: " + env_path);
    return;
  }
  std::string line;
  while (std::getline(file, line)) {
    line = TrimWhitespace(line);
    if (line.empty() || line[0] == '#') continue;
    auto pos = line.find('=');
    if (pos == std::string::npos) continue;
    std::string key = TrimWhitespace(line.substr(0, pos));
    std::string value = TrimWhitespace(line.substr(pos + 1));
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') value = value.substr(1, value.size() - 2);
    if (!key.empty()) cache_[key] = value;
  }
}

std::optional<std::string> ConfigManager::Get(const std::string& key) {
  auto it = cache_.find(key);
  if (it == cache_.end()) return std::nullopt;
  return it->second;
}

std::string ConfigManager::GetOrThrow(const std::string& key) {
  auto v = Get(key);
  if (!v) throw std::runtime_error("Missing required config: " + key);
  return *v;
}

int ConfigManager::GetIntOr(const std::string& key, int default_value) {
  auto v = Get(key);
  if (!v) return default_value;
  try {
    return std::stoi(*v);
  } catch (const std::logic_error&) {
    Logger::Warning("config " + key + " is not an integer: " + *v);
    return default_value;
  }
}

std::uint64_t ConfigManager::GetUint64Or(const std::string& key, std::uint64_t default_value) {
  auto v = Get(key);
  if (!v) return default_value;
  if (v->empty() || v->front() == '-') {
    Logger::Warning("config " + key + " is not an unsigned integer: " + *v);
    return default_value;
  }
  try {
    return static_cast<std::uint64_t>(std::stoull(*v));
  } catch (const std::logic_error&) {
    Logger::Warning("config " + key + " is not an unsigned integer: " + *v);
    return default_value;
  }
}

bool ConfigManager::GetBoolOr(const std::string& key, bool default_value) {
  auto v = Get(key);
  if (!v) return default_value;
  std::string s = *v;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  if (s == "1" || s == "true" || s == "yes") return true;
  if (s == "0" || s == "false" || s == "no") return false;
  return default_value;
}

std::vector<std::pair<std::string, std::string>> ConfigManager::GetPairs(const std::string& key) {
  std::vector<std::pair<std::string, std::string>> out;
  auto v = Get(key);
  if (!v) return out;
  std::istringstream iss(*v);
  std::string kv;
  while (std::getline(iss, kv, ',')) {
    auto pos = kv.find(':');
    if (pos == std::string::npos) continue;
    std::string k = TrimWhitespace(kv.substr(0, pos));
    std::string val = TrimWhitespace(kv.substr(pos + 1));
    if (!k.empty()) out.emplace_back(k, val);
  }
  return out;
}

std::vector<std::string> ConfigManager::GetList(const std::string& key) {
  std::vector<std::string> out;
  auto v = Get(key);
  if (!v) return out;
  std::istringstream iss(*v);
  std::string s;
  while (std::getline(iss, s, ',')) {
    s = TrimWhitespace(s);
    if (!s.empty()) out.push_back(s);
  }
  return out;
}
