#ifndef STATEMENT_STORE_IMPL_HPP_
#define STATEMENT_STORE_IMPL_HPP_

#include "statement_store.hpp"

#include <shared_mutex>
#include <string>
#include <vector>

namespace statement_recon {

// In-memory implementation notes:
// - Rows live in two vectors mirroring the statements/transactions tables.
// - Readers share a lock; createStatement/deleteStatement take it exclusively,
//   so a commit is visible either completely or not at all.
// - No durability; used by tests and dry runs.

/**
 * In-memory implementation of the StatementStore interface.
 */
class InMemoryStatementStore : public StatementStore {
 public:
  InMemoryStatementStore() = default;

  // Non-copyable
  InMemoryStatementStore(const InMemoryStatementStore&) = delete;
  InMemoryStatementStore& operator=(const InMemoryStatementStore&) = delete;

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
  // Statements sorted most recent import first (ties: higher id first).
  std::vector<Statement> newestFirst() const;

  std::vector<Statement> statements_;
  std::vector<Transaction> transactions_;

  int64_t nextStatementId_ = 1;
  int64_t nextTransactionId_ = 1;

  mutable std::shared_mutex mutex_;
};

}  // namespace statement_recon

#endif  // STATEMENT_STORE_IMPL_HPP_
