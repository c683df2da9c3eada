#include "registry/registry.hpp"
#include "common/logger.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

JsonRegistry JsonRegistry::FromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) throw std::runtime_error("cannot open registry file: " + path);
  std::stringstream ss;
  ss << in.rdbuf();
  JsonRegistry r = FromString(ss.str());
  Logger::Info("registry loaded from " + path + ": " + std::to_string(r.verified_.size()) + " verified, "
               + std::to_string(r.assets_.size()) + " assets");
  return r;
}

JsonRegistry JsonRegistry::FromString(const std::string& document) {
  JsonRegistry r;
  json j;
  try {
    j = json::parse(document);
  } catch (const json::parse_error& e) {
    throw std::runtime_error(std::string("registry is not valid JSON: ") + e.what());
  }
  if (!j.is_object()) throw std::runtime_error("registry must be a JSON object");
  if (j.contains("verified")) {
    if (!j["verified"].is_array()) throw std::runtime_error("registry 'verified' must be an array");
    for (const auto& v : j["verified"]) {
      if (!v.is_string()) throw std::runtime_error("registry 'verified' entries must be strings");
      r.verified_.insert(v.get<std::string>());
    }
  }
  if (j.contains("assets")) {
    if (!j["assets"].is_object()) throw std::runtime_error("registry 'assets' must be an object");
    for (auto it = j["assets"].begin(); it != j["assets"].end(); ++it) {
      if (!it.value().is_string()) throw std::runtime_error("registry asset owners must be strings");
      std::uint64_t id = 0;
      try {
        id = std::stoull(it.key());
      } catch (const std::logic_error&) {
        throw std::runtime_error("registry asset id is not a number: " + it.key());
      }
      r.assets_[id] = it.value().get<std::string>();
    }
  }
  return r;
}

bool JsonRegistry::IsVerified(const Identity& identity) {
  return verified_.count(identity) > 0;
}

std::optional<Identity> JsonRegistry::GetAssetOwner(std::uint64_t asset_id) {
  auto it = assets_.find(asset_id);
  if (it == assets_.end()) return std::nullopt;
  return it->second;
}
