#ifndef PAGE_EXTRACTION_HPP_
#define PAGE_EXTRACTION_HPP_

#include "domain/models.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace statement_recon {
namespace extraction {

/**
 * One candidate row as read from a page, before payments are removed.
 */
struct ExtractedRow {
  std::string trans_date;
  std::string posting_date;
  std::string description;
  double amount = 0.0;
  bool is_payment = false;
};

/**
 * Typed result of extracting one page. Metadata fields are unset when the page
 * did not show them.
 */
struct PageExtraction {
  std::vector<ExtractedRow> rows;
  std::optional<int> cutoff_day;
  std::optional<std::string> issuer_name;
  std::optional<std::string> card_name;
  size_t dropped_rows = 0;  // malformed rows skipped while parsing
};

/**
 * Converts an extraction payload (keys `transactions`, `cutoff_day`,
 * `bank_name`, `card_name`) into a PageExtraction. Malformed rows are dropped
 * and counted; a payload that is not a JSON object throws std::invalid_argument.
 */
PageExtraction parsePageExtraction(const nlohmann::json& page,
                                   const std::string& correlation_id = "");

/**
 * Parses a raw model reply, tolerating a surrounding ```json fence.
 * Throws nlohmann::json::parse_error when the text is not JSON.
 */
nlohmann::json parseModelResponse(const std::string& text);

// Removes rows flagged as card payments.
std::vector<ExtractedRow> dropPayments(std::vector<ExtractedRow> rows);

/**
 * Removes rows dated more than `recency_years` before `current_year`.
 * Rows without a readable year are kept. Returns the number removed.
 */
size_t dropStaleRows(std::vector<ExtractedRow>& rows, int current_year, int recency_years);

// Rows become Transactions with the default category.
std::vector<Transaction> toTransactions(const std::vector<ExtractedRow>& rows);

}  // namespace extraction
}  // namespace statement_recon

#endif  // PAGE_EXTRACTION_HPP_
