#include "domain/models.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <set>
#include <sstream>

namespace statement_recon {

namespace {

std::string formatNow(const char* pattern) {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  std::tm local{};
  localtime_r(&time_t, &local);

  std::stringstream ss;
  ss << std::put_time(&local, pattern);
  return ss.str();
}

bool isDigits(const std::string& s, size_t pos, size_t len) {
  if (pos + len > s.size()) return false;
  for (size_t i = pos; i < pos + len; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
  }
  return true;
}

// "YYYY-MM" of a YYYY-MM-DD date, or empty when the date is malformed.
std::string monthOf(const std::string& date) {
  if (date.size() < 10 || !isDigits(date, 0, 4) || date[4] != '-' ||
      !isDigits(date, 5, 2) || date[7] != '-' || !isDigits(date, 8, 2)) {
    return "";
  }
  int month = std::stoi(date.substr(5, 2));
  if (month < 1 || month > 12) return "";
  return date.substr(0, 7);
}

std::string previousMonth(const std::string& today) {
  std::string month = monthOf(today);
  if (month.empty()) return "";

  int y = std::stoi(month.substr(0, 4));
  int m = std::stoi(month.substr(5, 2)) - 1;
  if (m == 0) {
    m = 12;
    y -= 1;
  }

  std::stringstream ss;
  ss << std::setfill('0') << std::setw(4) << y << "-" << std::setw(2) << m;
  return ss.str();
}

}  // namespace

std::optional<PeriodFilter> parsePeriodFilter(const std::string& name) {
  if (name == "all") return PeriodFilter::ALL;
  if (name == "current_month") return PeriodFilter::CURRENT_MONTH;
  if (name == "last_month") return PeriodFilter::LAST_MONTH;
  if (name == "last_3_months" || name == "3_months") return PeriodFilter::LAST_3_MONTHS;
  if (name == "last_6_months" || name == "6_months") return PeriodFilter::LAST_6_MONTHS;
  return std::nullopt;
}

bool isIsoDate(const std::string& date) {
  return date.size() == 10 && !monthOf(date).empty();
}

std::optional<std::string> estimatePeriod(const std::vector<Transaction>& transactions) {
  std::optional<std::string> latest;
  for (const auto& tx : transactions) {
    if (!isIsoDate(tx.trans_date)) continue;
    if (!latest || tx.trans_date > *latest) {
      latest = tx.trans_date;
    }
  }
  if (!latest) return std::nullopt;
  return latest->substr(0, 7);
}

std::string derivePeriod(const std::vector<Transaction>& transactions,
                         const std::string& current_month) {
  return estimatePeriod(transactions).value_or(current_month);
}

double positiveTotal(const std::vector<Transaction>& transactions) {
  double total = 0.0;
  for (const auto& tx : transactions) {
    if (tx.amount > 0) total += tx.amount;
  }
  return total;
}

std::string trim(const std::string& text) {
  auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

std::string joinList(const std::vector<std::string>& items, const std::string& separator) {
  std::string joined;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) joined += separator;
    joined += items[i];
  }
  return joined;
}

std::vector<std::string> splitList(const std::string& joined, char separator) {
  std::vector<std::string> parts;
  std::stringstream ss(joined);
  std::string item;
  while (std::getline(ss, item, separator)) {
    std::string trimmed = trim(item);
    if (!trimmed.empty()) parts.push_back(trimmed);
  }
  return parts;
}

std::string currentDate() {
  return formatNow("%Y-%m-%d");
}

std::string currentMonth() {
  return formatNow("%Y-%m");
}

std::string currentTimestamp() {
  return formatNow("%Y-%m-%dT%H:%M:%S");
}

int currentYear() {
  return std::stoi(formatNow("%Y"));
}

std::vector<LedgerRow> filterByPeriod(std::vector<LedgerRow> rows, PeriodFilter filter,
                                      const std::string& today) {
  std::set<std::string> months;

  switch (filter) {
    case PeriodFilter::ALL:
      return rows;
    case PeriodFilter::CURRENT_MONTH:
      months.insert(monthOf(today));
      break;
    case PeriodFilter::LAST_MONTH:
      months.insert(previousMonth(today));
      break;
    case PeriodFilter::LAST_3_MONTHS:
    case PeriodFilter::LAST_6_MONTHS: {
      // Most recent months present in the data, not calendar months.
      size_t n = filter == PeriodFilter::LAST_3_MONTHS ? 3 : 6;
      std::set<std::string> present;
      for (const auto& row : rows) {
        std::string month = monthOf(row.transaction.trans_date);
        if (!month.empty()) present.insert(month);
      }
      for (auto it = present.rbegin(); it != present.rend() && months.size() < n; ++it) {
        months.insert(*it);
      }
      break;
    }
  }
  months.erase("");

  rows.erase(std::remove_if(rows.begin(), rows.end(),
                            [&months](const LedgerRow& row) {
                              return months.count(monthOf(row.transaction.trans_date)) == 0;
                            }),
             rows.end());
  return rows;
}

}  // namespace statement_recon
