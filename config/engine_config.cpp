#include "config/engine_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace statement_recon {
namespace config {

namespace {

const char* const kComponent = "config";

template <typename T>
void readKey(const nlohmann::json& section, const char* key, T& target) {
  auto it = section.find(key);
  if (it != section.end() && !it->is_null()) {
    target = it->get<T>();
  }
}

const char* env(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

void validate(const EngineConfig& config) {
  const auto& r = config.reconciliation;
  if (r.amount_tolerance < 0) {
    throw std::invalid_argument("reconciliation.amount_tolerance must not be negative");
  }
  if (r.soft_overlap_threshold < 0 || r.soft_overlap_threshold > 1) {
    throw std::invalid_argument("reconciliation.soft_overlap_threshold must be within [0, 1]");
  }
  if (r.amount_slack <= 0) {
    throw std::invalid_argument("reconciliation.amount_slack must be positive");
  }
  if (r.recency_years < 0) {
    throw std::invalid_argument("reconciliation.recency_years must not be negative");
  }
  if (config.database.port <= 0 || config.database.port > 65535) {
    throw std::invalid_argument("database.port is out of range");
  }
}

}  // namespace

std::optional<observability::LogLevel> ConfigLoader::parseLogLevel(const std::string& name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (upper == "DEBUG") return observability::LogLevel::DEBUG;
  if (upper == "INFO") return observability::LogLevel::INFO;
  if (upper == "WARN" || upper == "WARNING") return observability::LogLevel::WARN;
  if (upper == "ERROR") return observability::LogLevel::ERROR;
  if (upper == "FATAL") return observability::LogLevel::FATAL;
  return std::nullopt;
}

EngineConfig ConfigLoader::fromJson(const nlohmann::json& json) {
  EngineConfig config;
  if (!json.is_object()) {
    throw std::invalid_argument("configuration root must be a JSON object");
  }

  if (json.contains("database")) {
    const auto& db = json["database"];
    readKey(db, "host", config.database.host);
    readKey(db, "port", config.database.port);
    readKey(db, "name", config.database.database);
    readKey(db, "username", config.database.username);
    readKey(db, "password", config.database.password);
    readKey(db, "connect_timeout", config.database.connection_timeout);
  }

  if (json.contains("reconciliation")) {
    const auto& r = json["reconciliation"];
    readKey(r, "amount_tolerance", config.reconciliation.amount_tolerance);
    readKey(r, "soft_overlap_threshold", config.reconciliation.soft_overlap_threshold);
    readKey(r, "amount_slack", config.reconciliation.amount_slack);
    readKey(r, "recency_years", config.reconciliation.recency_years);
  }

  if (json.contains("log_level")) {
    std::string name = json["log_level"].get<std::string>();
    auto level = parseLogLevel(name);
    if (!level) {
      throw std::invalid_argument("unknown log_level '" + name + "'");
    }
    config.log_level = *level;
  }

  readKey(json, "schema_path", config.schema_path);

  validate(config);
  return config;
}

void ConfigLoader::applyEnvironment(EngineConfig& config) {
  if (const char* host = env("STATEMENT_RECON_DB_HOST")) config.database.host = host;
  if (const char* name = env("STATEMENT_RECON_DB_NAME")) config.database.database = name;
  if (const char* user = env("STATEMENT_RECON_DB_USER")) config.database.username = user;
  if (const char* password = env("STATEMENT_RECON_DB_PASSWORD")) {
    config.database.password = password;
  }

  if (const char* port = env("STATEMENT_RECON_DB_PORT")) {
    try {
      int value = std::stoi(port);
      if (value <= 0 || value > 65535) throw std::out_of_range("port");
      config.database.port = value;
    } catch (const std::exception&) {
      RECON_LOG_WARN(std::string("Ignoring invalid STATEMENT_RECON_DB_PORT: ") + port, kComponent);
    }
  }
}

EngineConfig ConfigLoader::load(const std::string& path) {
  EngineConfig config;

  if (!path.empty() && std::filesystem::exists(path)) {
    try {
      std::ifstream in(path);
      nlohmann::json json;
      in >> json;
      config = fromJson(json);
      RECON_LOG_INFO("Loaded configuration from " + path, kComponent);
    } catch (const std::exception& e) {
      RECON_LOG_ERROR("Error reading " + path + ", using defaults: " + e.what(), kComponent);
      config = EngineConfig();
    }
  }

  applyEnvironment(config);
  return config;
}

}  // namespace config
}  // namespace statement_recon
