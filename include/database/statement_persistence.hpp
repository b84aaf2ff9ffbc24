#ifndef STATEMENT_PERSISTENCE_HPP_
#define STATEMENT_PERSISTENCE_HPP_

#include "database/postgres_connection.hpp"
#include "statement_store.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace statement_recon {
namespace database {

/**
 * PostgreSQL-backed StatementStore.
 *
 * Statements keep their filenames joined with ", " and their fingerprints
 * joined with "," in single text columns. Transactions reference their
 * statement with ON DELETE CASCADE. Rows that fail to convert are logged and
 * skipped by the read operations.
 *
 * Every operation holds the store mutex for its whole duration, so a write's
 * SQL transaction never interleaves with another call on the shared
 * connection.
 */
class PostgresStatementStore : public StatementStore {
 public:
  explicit PostgresStatementStore(std::shared_ptr<PostgresConnection> conn);
  ~PostgresStatementStore() override = default;

  // Non-copyable
  PostgresStatementStore(const PostgresStatementStore&) = delete;
  PostgresStatementStore& operator=(const PostgresStatementStore&) = delete;

  /**
   * Create tables and indexes from the schema file.
   */
  bool initializeSchema(const std::string& schema_path);

  Statement createStatement(const StatementDraft& draft) override;
  std::vector<Statement> listStatements() override;
  std::vector<LedgerRow> listTransactions(PeriodFilter filter) override;
  bool deleteStatement(int64_t statement_id) override;

  std::vector<Statement> statementsWithFingerprints() override;
  std::vector<StatementTotal> statementTotalsForPeriod(const std::string& period) override;
  bool hasMatchingTransaction(const TransactionProbe& probe) override;
  std::vector<std::string> previousIssuers() override;

  size_t statementCount() override;
  size_t transactionCount() override;

 private:
  bool executeSchemaFile(const std::string& schema_path);
  size_t countRows(const std::string& table);

  std::shared_ptr<PostgresConnection> conn_;
  std::mutex mutex_;
};

}  // namespace database
}  // namespace statement_recon

#endif  // STATEMENT_PERSISTENCE_HPP_
