#ifndef STATEMENT_STORE_HPP_
#define STATEMENT_STORE_HPP_

#include "domain/models.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace statement_recon {

/**
 * Raised by a store when a write cannot be completed. A failed write leaves
 * no rows behind.
 */
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Abstract two-table store (statements, transactions).
 * Read operations never throw; they log and return what could be read.
 */
class StatementStore {
 public:
  virtual ~StatementStore() = default;

  /**
   * Writes one statement and all of its transactions atomically and returns the
   * stored statement. Throws StorageError on failure.
   */
  virtual Statement createStatement(const StatementDraft& draft) = 0;

  /**
   * All statements, most recently imported first.
   */
  virtual std::vector<Statement> listStatements() = 0;

  /**
   * Stored transactions joined with their statement, newest date first.
   */
  virtual std::vector<LedgerRow> listTransactions(PeriodFilter filter) = 0;

  /**
   * Deletes a statement and every transaction it owns. Returns false when the
   * id is unknown; throws StorageError when the delete fails.
   */
  virtual bool deleteStatement(int64_t statement_id) = 0;

  /** Statements that carry at least one fingerprint. */
  virtual std::vector<Statement> statementsWithFingerprints() = 0;

  /** Statements of `period` with their positive-amount totals. */
  virtual std::vector<StatementTotal> statementTotalsForPeriod(const std::string& period) = 0;

  /** True when some stored transaction matches the probe. */
  virtual bool hasMatchingTransaction(const TransactionProbe& probe) = 0;

  /** Distinct non-empty issuer labels, most recently imported first. */
  virtual std::vector<std::string> previousIssuers() = 0;

  virtual size_t statementCount() = 0;
  virtual size_t transactionCount() = 0;
};

}  // namespace statement_recon

#endif  // STATEMENT_STORE_HPP_
