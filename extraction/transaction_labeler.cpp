#include "extraction/transaction_labeler.hpp"
#include "domain/categories.hpp"
#include "observability/logger.hpp"

#include <stdexcept>

namespace statement_recon {
namespace extraction {

namespace {
const char* const kComponent = "labeler";
}

RecordedLabeler::RecordedLabeler(const nlohmann::json& labels) {
  if (labels.is_null()) return;
  if (!labels.is_object()) {
    throw std::invalid_argument("labels must be a JSON object");
  }

  for (auto it = labels.begin(); it != labels.end(); ++it) {
    const auto& entry = it.value();
    std::string category = entry.value("category", std::string(kDefaultCategory));
    std::optional<std::string> subcategory;
    if (entry.contains("subcategory") && entry["subcategory"].is_string()) {
      subcategory = entry["subcategory"].get<std::string>();
    }
    labels_[it.key()] = {category, subcategory};
  }
}

std::vector<std::string> RecordedLabeler::categorize(const std::vector<std::string>& descriptions) {
  std::vector<std::string> result;
  result.reserve(descriptions.size());
  for (const auto& description : descriptions) {
    auto it = labels_.find(description);
    result.push_back(it == labels_.end() ? std::string(kDefaultCategory) : it->second.first);
  }
  return result;
}

std::vector<std::optional<std::string>> RecordedLabeler::subcategorize(
    const std::vector<std::string>& descriptions,
    const std::vector<std::string>& /*categories*/) {
  std::vector<std::optional<std::string>> result;
  result.reserve(descriptions.size());
  for (const auto& description : descriptions) {
    auto it = labels_.find(description);
    result.push_back(it == labels_.end() ? std::nullopt : it->second.second);
  }
  return result;
}

void applyLabels(std::vector<Transaction>& transactions, TransactionLabeler* labeler,
                 const std::string& correlation_id) {
  for (auto& tx : transactions) {
    tx.category = kDefaultCategory;
    tx.subcategory.reset();
  }
  if (!labeler || transactions.empty()) return;

  std::vector<std::string> descriptions;
  descriptions.reserve(transactions.size());
  for (const auto& tx : transactions) {
    descriptions.push_back(tx.description);
  }

  std::vector<std::string> categories;
  try {
    categories = labeler->categorize(descriptions);
    if (categories.size() != transactions.size()) {
      throw std::runtime_error("expected " + std::to_string(transactions.size()) +
                               " categories, got " + std::to_string(categories.size()));
    }
  } catch (const std::exception& e) {
    RECON_LOG_BUILDER(observability::LogLevel::WARN, "Categorization failed, using default",
                      kComponent, correlation_id)
        .field("error", e.what());
    return;
  }

  for (size_t i = 0; i < transactions.size(); ++i) {
    transactions[i].category = normalizeCategory(categories[i]);
    categories[i] = transactions[i].category;
  }

  try {
    auto subcategories = labeler->subcategorize(descriptions, categories);
    if (subcategories.size() != transactions.size()) {
      throw std::runtime_error("expected " + std::to_string(transactions.size()) +
                               " subcategories, got " + std::to_string(subcategories.size()));
    }
    for (size_t i = 0; i < transactions.size(); ++i) {
      transactions[i].subcategory = normalizeSubcategory(categories[i], subcategories[i]);
    }
  } catch (const std::exception& e) {
    RECON_LOG_BUILDER(observability::LogLevel::WARN, "Subcategorization failed", kComponent,
                      correlation_id)
        .field("error", e.what());
  }
}

}  // namespace extraction
}  // namespace statement_recon
