#include "statement_store_impl.hpp"
#include "domain/categories.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <set>

namespace statement_recon {

Statement InMemoryStatementStore::createStatement(const StatementDraft& draft) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  // Build every row first; the vectors are only touched once nothing can fail.
  Statement statement;
  statement.id = nextStatementId_;
  statement.filenames = draft.filenames;
  statement.issuer = draft.issuer;
  statement.period = derivePeriod(draft.transactions, currentMonth());
  statement.imported_at = currentTimestamp();
  statement.tx_count = static_cast<int>(draft.transactions.size());
  statement.cutoff_day = draft.cutoff_day;
  statement.fingerprints = draft.fingerprints;

  std::vector<Transaction> rows;
  rows.reserve(draft.transactions.size());
  int64_t tx_id = nextTransactionId_;
  for (const auto& tx : draft.transactions) {
    if (!std::isfinite(tx.amount)) {
      throw StorageError("Transaction amount is not a finite number: " + tx.description);
    }
    Transaction row = tx;
    row.id = tx_id++;
    row.statement_id = statement.id;
    row.issuer = draft.issuer;
    row.category = normalizeCategory(tx.category);
    row.subcategory = normalizeSubcategory(row.category, tx.subcategory);
    rows.push_back(std::move(row));
  }

  statements_.push_back(statement);
  transactions_.insert(transactions_.end(), rows.begin(), rows.end());
  nextStatementId_ += 1;
  nextTransactionId_ = tx_id;

  return statement;
}

std::vector<Statement> InMemoryStatementStore::newestFirst() const {
  std::vector<Statement> sorted = statements_;
  std::sort(sorted.begin(), sorted.end(), [](const Statement& a, const Statement& b) {
    if (a.imported_at != b.imported_at) return a.imported_at > b.imported_at;
    return a.id > b.id;
  });
  return sorted;
}

std::vector<Statement> InMemoryStatementStore::listStatements() {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return newestFirst();
}

std::vector<LedgerRow> InMemoryStatementStore::listTransactions(PeriodFilter filter) {
  std::vector<LedgerRow> rows;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    rows.reserve(transactions_.size());
    for (const auto& tx : transactions_) {
      auto owner = std::find_if(statements_.begin(), statements_.end(),
                                [&tx](const Statement& s) { return s.id == tx.statement_id; });
      if (owner == statements_.end()) continue;
      rows.push_back(LedgerRow{tx, owner->period, owner->cutoff_day});
    }
  }

  std::stable_sort(rows.begin(), rows.end(), [](const LedgerRow& a, const LedgerRow& b) {
    return a.transaction.trans_date > b.transaction.trans_date;
  });
  return filterByPeriod(std::move(rows), filter, currentDate());
}

bool InMemoryStatementStore::deleteStatement(int64_t statement_id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto it = std::find_if(statements_.begin(), statements_.end(),
                         [statement_id](const Statement& s) { return s.id == statement_id; });
  if (it == statements_.end()) {
    return false;
  }

  transactions_.erase(std::remove_if(transactions_.begin(), transactions_.end(),
                                     [statement_id](const Transaction& tx) {
                                       return tx.statement_id == statement_id;
                                     }),
                      transactions_.end());
  statements_.erase(it);
  return true;
}

std::vector<Statement> InMemoryStatementStore::statementsWithFingerprints() {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  std::vector<Statement> result;
  for (const auto& statement : statements_) {
    if (!statement.fingerprints.empty()) {
      result.push_back(statement);
    }
  }
  return result;
}

std::vector<StatementTotal> InMemoryStatementStore::statementTotalsForPeriod(const std::string& period) {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  std::vector<StatementTotal> result;
  for (const auto& statement : statements_) {
    if (statement.period != period) continue;

    StatementTotal total{statement, 0.0};
    for (const auto& tx : transactions_) {
      if (tx.statement_id == statement.id && tx.amount > 0) {
        total.positive_total += tx.amount;
      }
    }
    result.push_back(std::move(total));
  }
  return result;
}

bool InMemoryStatementStore::hasMatchingTransaction(const TransactionProbe& probe) {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  return std::any_of(transactions_.begin(), transactions_.end(), [&probe](const Transaction& tx) {
    if (tx.trans_date != probe.trans_date) return false;
    if (probe.description && tx.description != *probe.description) return false;
    return std::abs(tx.amount - probe.amount) < probe.slack;
  });
}

std::vector<std::string> InMemoryStatementStore::previousIssuers() {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  std::vector<std::string> issuers;
  std::set<std::string> seen;
  for (const auto& statement : newestFirst()) {
    std::string issuer = trim(statement.issuer);
    if (issuer.empty()) continue;
    if (seen.insert(issuer).second) {
      issuers.push_back(issuer);
    }
  }
  return issuers;
}

size_t InMemoryStatementStore::statementCount() {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return statements_.size();
}

size_t InMemoryStatementStore::transactionCount() {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return transactions_.size();
}

}  // namespace statement_recon
