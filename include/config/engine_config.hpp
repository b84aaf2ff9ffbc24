#ifndef ENGINE_CONFIG_HPP_
#define ENGINE_CONFIG_HPP_

#include "database/postgres_connection.hpp"
#include "observability/logger.hpp"
#include "reconcile/reconciliation_orchestrator.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace statement_recon {
namespace config {

/**
 * Process-wide settings. Every field has a usable default.
 */
struct EngineConfig {
  database::PostgresConnection::Config database;
  reconcile::ReconciliationOrchestrator::Config reconciliation;
  observability::LogLevel log_level = observability::LogLevel::INFO;
  std::string schema_path = "database/schema.sql";
};

/**
 * Reads EngineConfig from a JSON file plus STATEMENT_RECON_DB_* environment
 * overrides.
 */
class ConfigLoader {
 public:
  /**
   * Missing file: defaults. Unreadable or malformed file: logged, defaults.
   * The environment is applied in both cases.
   */
  static EngineConfig load(const std::string& path);

  /**
   * Overlays the keys present in `json` on the defaults. Throws
   * nlohmann::json::exception when a present key has the wrong type and
   * std::invalid_argument when a value is out of range.
   */
  static EngineConfig fromJson(const nlohmann::json& json);

  static void applyEnvironment(EngineConfig& config);

  static std::optional<observability::LogLevel> parseLogLevel(const std::string& name);
};

}  // namespace config
}  // namespace statement_recon

#endif  // ENGINE_CONFIG_HPP_
