#ifndef POSTGRES_CONNECTION_HPP_
#define POSTGRES_CONNECTION_HPP_

#include <memory>
#include <string>
#include <mutex>
#include <vector>
#include <optional>
#include <postgresql/libpq-fe.h>

namespace statement_recon {
namespace database {

// Owning handle for a libpq result.
using PgResult = std::unique_ptr<PGresult, decltype(&PQclear)>;

/**
 * PostgreSQL database connection wrapper.
 * Handles connection management and query execution. Every call is
 * serialized on the connection mutex.
 */
class PostgresConnection {
 public:
  /**
   * Connection configuration
   */
  struct Config {
    std::string host = "localhost";
    int port = 5432;
    std::string database = "statement_recon";
    std::string username = "statement_recon";
    std::string password = "";
    int connection_timeout = 30;  // seconds
  };

  explicit PostgresConnection(const Config& config);
  ~PostgresConnection();

  // Non-copyable
  PostgresConnection(const PostgresConnection&) = delete;
  PostgresConnection& operator=(const PostgresConnection&) = delete;

  bool connect();
  void disconnect();
  bool isConnected() const;

  /**
   * Execute a statement that doesn't return rows.
   */
  bool executeQuery(const std::string& query);

  /**
   * Execute a parameterized query. A nullopt parameter is sent as SQL NULL.
   * Returns an empty handle on failure.
   */
  PgResult executeParameterizedQuery(const std::string& query,
                                     const std::vector<std::optional<std::string>>& params);

  bool beginTransaction();
  bool commitTransaction();
  bool rollbackTransaction();

  std::string getLastError() const;

  /**
   * Get connection info for logging (no password).
   */
  std::string getConnectionInfo() const;

 private:
  bool executeLocked(const std::string& query);
  void disconnectLocked();

  Config config_;
  PGconn* connection_;
  mutable std::mutex mutex_;
  bool in_transaction_;
};

/**
 * RAII wrapper for database transactions. Rolls back on destruction unless
 * commit() succeeded.
 */
class TransactionGuard {
 public:
  explicit TransactionGuard(PostgresConnection& conn);
  ~TransactionGuard();

  // Non-copyable
  TransactionGuard(const TransactionGuard&) = delete;
  TransactionGuard& operator=(const TransactionGuard&) = delete;

  bool commit();
  void rollback();

 private:
  PostgresConnection& conn_;
  bool finished_;
};

}  // namespace database
}  // namespace statement_recon

#endif  // POSTGRES_CONNECTION_HPP_
