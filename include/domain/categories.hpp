#ifndef CATEGORIES_HPP_
#define CATEGORIES_HPP_

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace statement_recon {

inline const char* const kDefaultCategory = "other";

// Fixed category vocabulary, in display order; "other" is last.
const std::vector<std::string>& categories();

// Subcategory vocabulary per category. Categories without an entry take none.
const std::map<std::string, std::vector<std::string>>& subcategories();

bool isKnownCategory(const std::string& category);

// Unknown or empty labels collapse to "other".
std::string normalizeCategory(const std::string& label);

// Returns the label when it belongs to `category`'s set, otherwise nullopt.
std::optional<std::string> normalizeSubcategory(const std::string& category,
                                                const std::optional<std::string>& label);

}  // namespace statement_recon

#endif  // CATEGORIES_HPP_
