#include "extraction/page_extraction.hpp"
#include "domain/categories.hpp"
#include "observability/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace statement_recon {
namespace extraction {

namespace {

const char* const kComponent = "extraction";

std::optional<std::string> optionalText(const nlohmann::json& page, const char* key) {
  auto it = page.find(key);
  if (it == page.end() || !it->is_string()) return std::nullopt;
  std::string value = trim(it->get<std::string>());
  if (value.empty()) return std::nullopt;
  return value;
}

// Day of month 1-31, given as a number or a numeric string.
std::optional<int> optionalCutoff(const nlohmann::json& page) {
  auto it = page.find("cutoff_day");
  if (it == page.end() || it->is_null()) return std::nullopt;

  int day = 0;
  if (it->is_number_integer()) {
    day = it->get<int>();
  } else if (it->is_number()) {
    double value = it->get<double>();
    if (value != std::floor(value)) return std::nullopt;
    day = static_cast<int>(value);
  } else if (it->is_string()) {
    try {
      day = std::stoi(it->get<std::string>());
    } catch (const std::exception&) {
      return std::nullopt;
    }
  } else {
    return std::nullopt;
  }

  if (day < 1 || day > 31) return std::nullopt;
  return day;
}

double readAmount(const nlohmann::json& value) {
  if (value.is_number()) return value.get<double>();
  if (value.is_string()) {
    std::string text = value.get<std::string>();
    text.erase(std::remove(text.begin(), text.end(), ','), text.end());
    size_t consumed = 0;
    double amount = std::stod(text, &consumed);
    if (!trim(text.substr(consumed)).empty()) {
      throw std::invalid_argument("trailing characters in amount");
    }
    return amount;
  }
  throw std::invalid_argument("amount is not a number");
}

ExtractedRow readRow(const nlohmann::json& item) {
  if (!item.is_object()) {
    throw std::invalid_argument("row is not an object");
  }

  ExtractedRow row;
  row.trans_date = trim(item.at("trans_date").get<std::string>());
  // Dates the model could not read ("N/A", "12/05") leave the row undated.
  if (!isIsoDate(row.trans_date)) {
    row.trans_date.clear();
  }
  if (item.contains("posting_date") && item["posting_date"].is_string()) {
    row.posting_date = trim(item["posting_date"].get<std::string>());
  }
  if (item.contains("description") && item["description"].is_string()) {
    row.description = trim(item["description"].get<std::string>());
  }
  row.amount = readAmount(item.at("amount"));
  if (!std::isfinite(row.amount)) {
    throw std::invalid_argument("amount is not finite");
  }
  if (item.contains("is_payment") && item["is_payment"].is_boolean()) {
    row.is_payment = item["is_payment"].get<bool>();
  }
  return row;
}

}  // namespace

PageExtraction parsePageExtraction(const nlohmann::json& page, const std::string& correlation_id) {
  if (!page.is_object()) {
    throw std::invalid_argument("extraction payload is not a JSON object");
  }

  PageExtraction result;
  result.cutoff_day = optionalCutoff(page);
  result.issuer_name = optionalText(page, "bank_name");
  result.card_name = optionalText(page, "card_name");

  auto it = page.find("transactions");
  if (it == page.end() || it->is_null()) return result;
  if (!it->is_array()) {
    throw std::invalid_argument("'transactions' is not an array");
  }

  for (size_t i = 0; i < it->size(); ++i) {
    try {
      result.rows.push_back(readRow((*it)[i]));
    } catch (const std::exception& e) {
      ++result.dropped_rows;
      RECON_LOG_BUILDER(observability::LogLevel::WARN, "Dropping malformed extracted row",
                        kComponent, correlation_id)
          .field("row", i)
          .field("error", e.what());
    }
  }

  return result;
}

nlohmann::json parseModelResponse(const std::string& text) {
  std::string body = trim(text);

  if (body.rfind("```", 0) == 0) {
    auto first_newline = body.find('\n');
    body = first_newline == std::string::npos ? std::string() : body.substr(first_newline + 1);
    auto closing = body.rfind("```");
    if (closing != std::string::npos) {
      body = body.substr(0, closing);
    }
  }

  return nlohmann::json::parse(trim(body));
}

std::vector<ExtractedRow> dropPayments(std::vector<ExtractedRow> rows) {
  rows.erase(std::remove_if(rows.begin(), rows.end(),
                            [](const ExtractedRow& row) { return row.is_payment; }),
             rows.end());
  return rows;
}

size_t dropStaleRows(std::vector<ExtractedRow>& rows, int current_year, int recency_years) {
  auto stale = [current_year, recency_years](const ExtractedRow& row) {
    if (row.trans_date.size() < 4) return false;
    for (size_t i = 0; i < 4; ++i) {
      if (!std::isdigit(static_cast<unsigned char>(row.trans_date[i]))) return false;
    }
    int year = std::stoi(row.trans_date.substr(0, 4));
    return current_year - year > recency_years;
  };

  size_t before = rows.size();
  rows.erase(std::remove_if(rows.begin(), rows.end(), stale), rows.end());
  return before - rows.size();
}

std::vector<Transaction> toTransactions(const std::vector<ExtractedRow>& rows) {
  std::vector<Transaction> transactions;
  transactions.reserve(rows.size());
  for (const auto& row : rows) {
    Transaction tx(row.trans_date, row.description, row.amount);
    tx.posting_date = row.posting_date;
    tx.category = kDefaultCategory;
    transactions.push_back(std::move(tx));
  }
  return transactions;
}

}  // namespace extraction
}  // namespace statement_recon
