#include "database/postgres_connection.hpp"
#include "observability/logger.hpp"

#include <sstream>
#include <stdexcept>

namespace statement_recon {
namespace database {

namespace {
const char* const kComponent = "postgres";
}

PostgresConnection::PostgresConnection(const Config& config)
    : config_(config), connection_(nullptr), in_transaction_(false) {
}

PostgresConnection::~PostgresConnection() {
  disconnect();
}

bool PostgresConnection::connect() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (connection_) {
    disconnectLocked();
  }

  std::stringstream conn_str;
  conn_str << "host=" << config_.host
           << " port=" << config_.port
           << " dbname=" << config_.database
           << " user=" << config_.username
           << " connect_timeout=" << config_.connection_timeout;
  if (!config_.password.empty()) {
    conn_str << " password=" << config_.password;
  }

  connection_ = PQconnectdb(conn_str.str().c_str());

  if (PQstatus(connection_) != CONNECTION_OK) {
    RECON_LOG_ERROR("Database connection failed: " + std::string(PQerrorMessage(connection_)),
                    kComponent);
    disconnectLocked();
    return false;
  }

  RECON_LOG_INFO("Connected to PostgreSQL database: " + getConnectionInfo(), kComponent);
  return true;
}

void PostgresConnection::disconnect() {
  std::lock_guard<std::mutex> lock(mutex_);
  disconnectLocked();
}

void PostgresConnection::disconnectLocked() {
  if (connection_) {
    if (in_transaction_) {
      executeLocked("ROLLBACK");
      in_transaction_ = false;
    }
    PQfinish(connection_);
    connection_ = nullptr;
  }
}

bool PostgresConnection::isConnected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connection_ && PQstatus(connection_) == CONNECTION_OK;
}

bool PostgresConnection::executeQuery(const std::string& query) {
  std::lock_guard<std::mutex> lock(mutex_);
  return executeLocked(query);
}

bool PostgresConnection::executeLocked(const std::string& query) {
  if (!connection_) return false;

  PgResult result(PQexec(connection_, query.c_str()), &PQclear);

  if (!result) {
    RECON_LOG_ERROR("Query execution failed: connection lost", kComponent);
    return false;
  }

  ExecStatusType status = PQresultStatus(result.get());
  bool success = (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK);

  if (!success) {
    RECON_LOG_ERROR("Query failed: " + std::string(PQresultErrorMessage(result.get())), kComponent);
  }

  return success;
}

PgResult PostgresConnection::executeParameterizedQuery(
    const std::string& query, const std::vector<std::optional<std::string>>& params) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!connection_) return PgResult(nullptr, &PQclear);

  std::vector<const char*> values;
  values.reserve(params.size());
  for (const auto& param : params) {
    values.push_back(param ? param->c_str() : nullptr);
  }

  PgResult result(PQexecParams(connection_, query.c_str(), static_cast<int>(values.size()),
                               nullptr, values.data(), nullptr, nullptr, 0),
                  &PQclear);

  if (!result) {
    RECON_LOG_ERROR("Parameterized query execution failed: connection lost", kComponent);
    return result;
  }

  ExecStatusType status = PQresultStatus(result.get());
  if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
    RECON_LOG_ERROR("Parameterized query failed: " +
                        std::string(PQresultErrorMessage(result.get())),
                    kComponent);
    return PgResult(nullptr, &PQclear);
  }

  return result;
}

bool PostgresConnection::beginTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (in_transaction_ || !executeLocked("BEGIN")) {
    return false;
  }

  in_transaction_ = true;
  return true;
}

bool PostgresConnection::commitTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!in_transaction_) {
    return false;
  }

  bool success = executeLocked("COMMIT");
  in_transaction_ = false;
  return success;
}

bool PostgresConnection::rollbackTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!in_transaction_) {
    return false;
  }

  bool success = executeLocked("ROLLBACK");
  in_transaction_ = false;
  return success;
}

std::string PostgresConnection::getLastError() const {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!connection_) {
    return "Not connected";
  }

  return PQerrorMessage(connection_);
}

std::string PostgresConnection::getConnectionInfo() const {
  std::stringstream ss;
  ss << config_.username << "@" << config_.host << ":" << config_.port << "/" << config_.database;
  return ss.str();
}

// TransactionGuard implementation
TransactionGuard::TransactionGuard(PostgresConnection& conn)
    : conn_(conn), finished_(false) {
  if (!conn_.beginTransaction()) {
    throw std::runtime_error("Failed to begin transaction");
  }
}

TransactionGuard::~TransactionGuard() {
  if (!finished_) {
    conn_.rollbackTransaction();
  }
}

bool TransactionGuard::commit() {
  if (finished_) return false;
  finished_ = true;
  return conn_.commitTransaction();
}

void TransactionGuard::rollback() {
  if (!finished_) {
    conn_.rollbackTransaction();
    finished_ = true;
  }
}

}  // namespace database
}  // namespace statement_recon
