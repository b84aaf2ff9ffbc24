#include "database/statement_persistence.hpp"
#include "domain/categories.hpp"
#include "observability/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <set>
#include <sstream>

namespace statement_recon {
namespace database {

namespace {

const char* const kComponent = "persistence";

// Column list shared by every statement query; readStatement() depends on the order.
const char* const kStatementColumns =
    "s.id, s.filename, s.issuer, s.period, s.imported_at, s.tx_count, s.cutoff_day, "
    "COALESCE(s.file_hash, '')";
const int kStatementColumnCount = 8;

std::string formatAmount(double amount) {
  std::ostringstream ss;
  ss << std::setprecision(15) << amount;
  return ss.str();
}

std::optional<std::string> nullable(const PGresult* result, int row, int col) {
  if (PQgetisnull(result, row, col)) return std::nullopt;
  return std::string(PQgetvalue(result, row, col));
}

// Throws std::invalid_argument / std::out_of_range on malformed numeric columns.
Statement readStatement(const PGresult* result, int row) {
  Statement statement;
  statement.id = std::stoll(PQgetvalue(result, row, 0));
  statement.filenames = splitList(PQgetvalue(result, row, 1), ',');
  statement.issuer = PQgetvalue(result, row, 2);
  statement.period = PQgetvalue(result, row, 3);
  statement.imported_at = PQgetvalue(result, row, 4);
  statement.tx_count = std::stoi(PQgetvalue(result, row, 5));
  if (auto cutoff = nullable(result, row, 6)) {
    statement.cutoff_day = std::stoi(*cutoff);
  }
  statement.fingerprints = splitList(PQgetvalue(result, row, 7), ',');
  return statement;
}

void logSkippedRow(const std::string& what, int row, const std::exception& e) {
  RECON_LOG_BUILDER(observability::LogLevel::WARN, "Skipping malformed stored row", kComponent, "")
      .field("query", what)
      .field("row", row)
      .field("error", e.what());
}

}  // namespace

PostgresStatementStore::PostgresStatementStore(std::shared_ptr<PostgresConnection> conn)
    : conn_(std::move(conn)) {
}

bool PostgresStatementStore::initializeSchema(const std::string& schema_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!executeSchemaFile(schema_path)) {
    RECON_LOG_ERROR("Failed to execute schema file " + schema_path, kComponent);
    return false;
  }

  RECON_LOG_INFO("Database schema initialized", kComponent);
  return true;
}

Statement PostgresStatementStore::createStatement(const StatementDraft& draft) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement statement;
  statement.filenames = draft.filenames;
  statement.issuer = draft.issuer;
  statement.period = derivePeriod(draft.transactions, currentMonth());
  statement.imported_at = currentTimestamp();
  statement.tx_count = static_cast<int>(draft.transactions.size());
  statement.cutoff_day = draft.cutoff_day;
  statement.fingerprints = draft.fingerprints;

  try {
    TransactionGuard transaction(*conn_);

    std::string insertStatement = R"(
      INSERT INTO statements (filename, issuer, period, imported_at, tx_count, cutoff_day, file_hash)
      VALUES ($1, $2, $3, $4, $5, $6, $7)
      RETURNING id
    )";

    auto result = conn_->executeParameterizedQuery(insertStatement, {
      joinList(draft.filenames, ", "),
      draft.issuer,
      statement.period,
      statement.imported_at,
      std::to_string(statement.tx_count),
      draft.cutoff_day ? std::optional<std::string>(std::to_string(*draft.cutoff_day)) : std::nullopt,
      draft.fingerprints.empty() ? std::nullopt
                                 : std::optional<std::string>(joinList(draft.fingerprints, ",")),
    });
    if (!result || PQntuples(result.get()) != 1) {
      throw StorageError("Failed to insert statement: " + conn_->getLastError());
    }
    statement.id = std::stoll(PQgetvalue(result.get(), 0, 0));

    std::string insertTransaction = R"(
      INSERT INTO transactions (
        statement_id, trans_date, posting_date, description,
        amount, category, subcategory, issuer
      ) VALUES ($1, $2, $3, $4, $5::double precision, $6, $7, $8)
    )";

    const std::string statement_id = std::to_string(statement.id);
    for (const auto& tx : draft.transactions) {
      if (!std::isfinite(tx.amount)) {
        throw StorageError("Transaction amount is not a finite number: " + tx.description);
      }
      std::string category = normalizeCategory(tx.category);

      auto txResult = conn_->executeParameterizedQuery(insertTransaction, {
        statement_id,
        tx.trans_date,
        tx.posting_date,
        tx.description,
        formatAmount(tx.amount),
        category,
        normalizeSubcategory(category, tx.subcategory),
        draft.issuer,
      });
      if (!txResult) {
        throw StorageError("Failed to insert transaction '" + tx.description + "': " +
                           conn_->getLastError());
      }
    }

    if (!transaction.commit()) {
      throw StorageError("Commit failed: " + conn_->getLastError());
    }
  } catch (const StorageError&) {
    throw;
  } catch (const std::exception& e) {
    throw StorageError(std::string("Statement write failed: ") + e.what());
  }

  RECON_LOG_BUILDER(observability::LogLevel::INFO, "Statement stored", kComponent, "")
      .field("statement_id", static_cast<long long>(statement.id))
      .field("period", statement.period)
      .field("transactions", static_cast<int>(statement.tx_count));
  return statement;
}

std::vector<Statement> PostgresStatementStore::listStatements() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Statement> statements;

  std::string query = std::string("SELECT ") + kStatementColumns +
                      " FROM statements s ORDER BY s.imported_at DESC, s.id DESC";
  auto result = conn_->executeParameterizedQuery(query, {});
  if (!result) return statements;

  int rows = PQntuples(result.get());
  for (int i = 0; i < rows; ++i) {
    try {
      statements.push_back(readStatement(result.get(), i));
    } catch (const std::exception& e) {
      logSkippedRow("listStatements", i, e);
    }
  }
  return statements;
}

std::vector<LedgerRow> PostgresStatementStore::listTransactions(PeriodFilter filter) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<LedgerRow> rows;

  std::string query = R"(
    SELECT t.id, t.statement_id, t.trans_date, t.posting_date, t.description,
           t.amount, t.category, t.subcategory, t.issuer, s.period, s.cutoff_day
    FROM transactions t
    JOIN statements s ON t.statement_id = s.id
    ORDER BY t.trans_date DESC
  )";
  auto result = conn_->executeParameterizedQuery(query, {});
  if (!result) return rows;

  int count = PQntuples(result.get());
  for (int i = 0; i < count; ++i) {
    try {
      LedgerRow row;
      Transaction& tx = row.transaction;
      tx.id = std::stoll(PQgetvalue(result.get(), i, 0));
      tx.statement_id = std::stoll(PQgetvalue(result.get(), i, 1));
      tx.trans_date = PQgetvalue(result.get(), i, 2);
      tx.posting_date = PQgetvalue(result.get(), i, 3);
      tx.description = PQgetvalue(result.get(), i, 4);
      tx.amount = std::stod(PQgetvalue(result.get(), i, 5));
      tx.category = PQgetvalue(result.get(), i, 6);
      tx.subcategory = nullable(result.get(), i, 7);
      tx.issuer = PQgetvalue(result.get(), i, 8);
      row.period = PQgetvalue(result.get(), i, 9);
      if (auto cutoff = nullable(result.get(), i, 10)) {
        row.cutoff_day = std::stoi(*cutoff);
      }
      rows.push_back(std::move(row));
    } catch (const std::exception& e) {
      logSkippedRow("listTransactions", i, e);
    }
  }

  return filterByPeriod(std::move(rows), filter, currentDate());
}

bool PostgresStatementStore::deleteStatement(int64_t statement_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  bool deleted = false;
  try {
    TransactionGuard transaction(*conn_);
    const std::string id = std::to_string(statement_id);

    // Explicit child delete keeps databases created without the cascade consistent.
    auto result = conn_->executeParameterizedQuery(
        "DELETE FROM transactions WHERE statement_id = $1", {id});
    if (!result) {
      throw StorageError("Failed to delete transactions of statement " + id);
    }

    result = conn_->executeParameterizedQuery("DELETE FROM statements WHERE id = $1", {id});
    if (!result) {
      throw StorageError("Failed to delete statement " + id);
    }
    deleted = std::string(PQcmdTuples(result.get())) != "0";

    if (!transaction.commit()) {
      throw StorageError("Commit failed: " + conn_->getLastError());
    }
  } catch (const StorageError&) {
    throw;
  } catch (const std::exception& e) {
    throw StorageError(std::string("Statement delete failed: ") + e.what());
  }

  if (deleted) {
    RECON_LOG_INFO("Deleted statement " + std::to_string(statement_id), kComponent);
  }
  return deleted;
}

std::vector<Statement> PostgresStatementStore::statementsWithFingerprints() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Statement> statements;

  std::string query = std::string("SELECT ") + kStatementColumns +
                      " FROM statements s WHERE s.file_hash IS NOT NULL AND s.file_hash <> ''"
                      " ORDER BY s.id";
  auto result = conn_->executeParameterizedQuery(query, {});
  if (!result) return statements;

  int rows = PQntuples(result.get());
  for (int i = 0; i < rows; ++i) {
    try {
      statements.push_back(readStatement(result.get(), i));
    } catch (const std::exception& e) {
      logSkippedRow("statementsWithFingerprints", i, e);
    }
  }
  return statements;
}

std::vector<StatementTotal> PostgresStatementStore::statementTotalsForPeriod(const std::string& period) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<StatementTotal> totals;

  std::string query = std::string("SELECT ") + kStatementColumns + R"(,
           COALESCE(SUM(CASE WHEN t.amount > 0 THEN t.amount ELSE 0 END), 0) AS total_amount
    FROM statements s
    LEFT JOIN transactions t ON t.statement_id = s.id
    WHERE s.period = $1
    GROUP BY s.id
    ORDER BY s.id
  )";
  auto result = conn_->executeParameterizedQuery(query, {period});
  if (!result) return totals;

  int rows = PQntuples(result.get());
  for (int i = 0; i < rows; ++i) {
    try {
      StatementTotal total;
      total.statement = readStatement(result.get(), i);
      total.positive_total = std::stod(PQgetvalue(result.get(), i, kStatementColumnCount));
      totals.push_back(std::move(total));
    } catch (const std::exception& e) {
      logSkippedRow("statementTotalsForPeriod", i, e);
    }
  }
  return totals;
}

bool PostgresStatementStore::hasMatchingTransaction(const TransactionProbe& probe) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string query = R"(
    SELECT 1 FROM transactions
    WHERE trans_date = $1
      AND ABS(amount - $2::double precision) < $3::double precision
  )";
  std::vector<std::optional<std::string>> params = {
    probe.trans_date, formatAmount(probe.amount), formatAmount(probe.slack)
  };
  if (probe.description) {
    query += " AND description = $4";
    params.push_back(*probe.description);
  }
  query += " LIMIT 1";

  auto result = conn_->executeParameterizedQuery(query, params);
  return result && PQntuples(result.get()) > 0;
}

std::vector<std::string> PostgresStatementStore::previousIssuers() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> issuers;

  std::string query = R"(
    SELECT issuer, MAX(imported_at) AS last_import
    FROM statements
    WHERE issuer IS NOT NULL AND issuer <> ''
    GROUP BY issuer
    ORDER BY last_import DESC
  )";
  auto result = conn_->executeParameterizedQuery(query, {});
  if (!result) return issuers;

  std::set<std::string> seen;
  int rows = PQntuples(result.get());
  for (int i = 0; i < rows; ++i) {
    std::string issuer = trim(PQgetvalue(result.get(), i, 0));
    if (!issuer.empty() && seen.insert(issuer).second) {
      issuers.push_back(issuer);
    }
  }
  return issuers;
}

size_t PostgresStatementStore::statementCount() {
  std::lock_guard<std::mutex> lock(mutex_);
  return countRows("statements");
}

size_t PostgresStatementStore::transactionCount() {
  std::lock_guard<std::mutex> lock(mutex_);
  return countRows("transactions");
}

size_t PostgresStatementStore::countRows(const std::string& table) {
  auto result = conn_->executeParameterizedQuery("SELECT COUNT(*) FROM " + table, {});
  if (!result || PQntuples(result.get()) == 0) return 0;

  try {
    return static_cast<size_t>(std::stoull(PQgetvalue(result.get(), 0, 0)));
  } catch (const std::exception& e) {
    logSkippedRow("count " + table, 0, e);
    return 0;
  }
}

bool PostgresStatementStore::executeSchemaFile(const std::string& schema_path) {
  std::ifstream schema_file(schema_path);
  if (!schema_file.is_open()) {
    RECON_LOG_ERROR("Could not open schema file: " + schema_path, kComponent);
    return false;
  }

  std::stringstream buffer;
  buffer << schema_file.rdbuf();
  std::string schema_sql = buffer.str();

  // Split by semicolon and execute each statement
  size_t pos = 0;
  while ((pos = schema_sql.find(';')) != std::string::npos) {
    std::string stmt = schema_sql.substr(0, pos);
    bool has_sql = std::any_of(stmt.begin(), stmt.end(), [](unsigned char c) {
      return std::isalnum(c) != 0;
    });
    if (has_sql) {
      if (!conn_->executeQuery(stmt)) {
        RECON_LOG_ERROR("Failed to execute schema statement: " + stmt.substr(0, 100), kComponent);
        return false;
      }
    }
    schema_sql.erase(0, pos + 1);
  }

  return true;
}

}  // namespace database
}  // namespace statement_recon
