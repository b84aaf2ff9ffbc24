#ifndef TRANSACTION_LABELER_HPP_
#define TRANSACTION_LABELER_HPP_

#include "domain/models.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace statement_recon {
namespace extraction {

/**
 * External category labeling collaborator. Results are validated against the
 * fixed vocabularies before they reach a Transaction.
 */
class TransactionLabeler {
 public:
  virtual ~TransactionLabeler() = default;

  // One category label per description.
  virtual std::vector<std::string> categorize(const std::vector<std::string>& descriptions) = 0;

  // One subcategory label (or none) per description, given its category.
  virtual std::vector<std::optional<std::string>> subcategorize(
      const std::vector<std::string>& descriptions,
      const std::vector<std::string>& categories) = 0;
};

/**
 * Labels from a fixed description -> {"category", "subcategory"} table.
 * Descriptions missing from the table are labeled "other".
 */
class RecordedLabeler : public TransactionLabeler {
 public:
  explicit RecordedLabeler(const nlohmann::json& labels);

  std::vector<std::string> categorize(const std::vector<std::string>& descriptions) override;
  std::vector<std::optional<std::string>> subcategorize(
      const std::vector<std::string>& descriptions,
      const std::vector<std::string>& categories) override;

 private:
  std::map<std::string, std::pair<std::string, std::optional<std::string>>> labels_;
};

/**
 * Sets category and subcategory on every transaction. Without a labeler, or
 * when it fails or answers with the wrong number of labels, categories fall
 * back to "other" and subcategories to none.
 */
void applyLabels(std::vector<Transaction>& transactions, TransactionLabeler* labeler,
                 const std::string& correlation_id = "");

}  // namespace extraction
}  // namespace statement_recon

#endif  // TRANSACTION_LABELER_HPP_
