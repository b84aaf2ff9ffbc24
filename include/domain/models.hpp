#ifndef MODELS_HPP_
#define MODELS_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace statement_recon {

/**
 * One stored (or pending) statement line.
 * `amount` is signed: positive is an expense, zero or negative is a credit,
 * cashback or payment adjustment.
 */
struct Transaction {
  int64_t id = 0;
  int64_t statement_id = 0;
  std::string trans_date;    // YYYY-MM-DD
  std::string posting_date;  // YYYY-MM-DD or empty
  std::string description;
  double amount = 0.0;
  std::string category = "other";
  std::optional<std::string> subcategory;
  std::string issuer;

  Transaction() = default;
  Transaction(const std::string& date, const std::string& desc, double amt)
      : trans_date(date), description(desc), amount(amt) {}
};

/**
 * One ingested document or multi-file batch.
 */
struct Statement {
  int64_t id = 0;
  std::vector<std::string> filenames;
  std::string issuer;
  std::string period;       // YYYY-MM
  std::string imported_at;  // ISO-8601, local time
  int tx_count = 0;
  std::optional<int> cutoff_day;
  std::vector<std::string> fingerprints;
};

/**
 * Everything a commit writes. The period and import timestamp are derived by
 * the store at save time.
 */
struct StatementDraft {
  std::vector<std::string> filenames;
  std::string issuer;
  std::optional<int> cutoff_day;
  std::vector<std::string> fingerprints;
  std::vector<Transaction> transactions;
};

/**
 * Stored statement together with the sum of its positive-amount transactions.
 */
struct StatementTotal {
  Statement statement;
  double positive_total = 0.0;
};

/**
 * Existence probe against stored transactions. Without a `description` only
 * date and amount are compared. Amounts match when |stored - amount| < slack.
 */
struct TransactionProbe {
  std::string trans_date;
  std::optional<std::string> description;
  double amount = 0.0;
  double slack = 1.0;
};

/**
 * Stored transaction joined with the owning statement's period data.
 */
struct LedgerRow {
  Transaction transaction;
  std::string period;
  std::optional<int> cutoff_day;
};

enum class PeriodFilter {
  ALL,
  CURRENT_MONTH,
  LAST_MONTH,
  LAST_3_MONTHS,
  LAST_6_MONTHS
};

std::optional<PeriodFilter> parsePeriodFilter(const std::string& name);

// True for a YYYY-MM-DD date whose month is 1-12.
bool isIsoDate(const std::string& date);

// Month (YYYY-MM) of the latest well-formed transaction date, or nullopt when
// no transaction carries one.
std::optional<std::string> estimatePeriod(const std::vector<Transaction>& transactions);

// Period stored on a new statement: estimatePeriod() falling back to `current_month`.
std::string derivePeriod(const std::vector<Transaction>& transactions,
                         const std::string& current_month);

double positiveTotal(const std::vector<Transaction>& transactions);

// Strips leading and trailing whitespace.
std::string trim(const std::string& text);

std::string joinList(const std::vector<std::string>& items, const std::string& separator);
std::vector<std::string> splitList(const std::string& joined, char separator);

// Wall-clock helpers, local time.
std::string currentDate();       // YYYY-MM-DD
std::string currentMonth();      // YYYY-MM
std::string currentTimestamp();  // YYYY-MM-DDTHH:MM:SS
int currentYear();

/**
 * Keeps the rows matching `filter`, evaluated relative to `today` (YYYY-MM-DD).
 * Rows whose date is not a valid YYYY-MM-DD never fall into a month window.
 */
std::vector<LedgerRow> filterByPeriod(std::vector<LedgerRow> rows, PeriodFilter filter,
                                      const std::string& today);

}  // namespace statement_recon

#endif  // MODELS_HPP_
