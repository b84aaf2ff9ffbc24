#include "domain/categories.hpp"

#include <algorithm>

namespace statement_recon {

const std::vector<std::string>& categories() {
  static const std::vector<std::string> kCategories = {
    "insurance",
    "subscription_digital",
    "convenience_store",
    "online_shopping",
    "tollway_transport",
    "food_drink",
    "supermarket",
    "phone_internet",
    "travel",
    "car_service",
    "health",
    "shopping",
    "other",
  };
  return kCategories;
}

const std::map<std::string, std::vector<std::string>>& subcategories() {
  static const std::map<std::string, std::vector<std::string>> kSubcategories = {
    {"food_drink", {"restaurant", "cafe", "food_delivery", "groceries"}},
    {"online_shopping", {"shopee", "lazada", "amazon", "other"}},
    {"tollway_transport", {"tollway", "taxi_ride_hailing", "rail", "fuel"}},
    {"travel", {"hotel", "flight", "tour", "attraction", "car_rental"}},
    {"subscription_digital", {"streaming", "music", "games", "cloud_software"}},
    {"convenience_store", {"cj", "7-eleven", "family_mart", "lotus_go", "other"}},
    {"supermarket", {"lotus", "big_c", "tops", "villa_market", "makro"}},
    {"phone_internet", {"ais", "true", "dtac", "nt", "fiber"}},
    {"insurance", {"car", "health", "life", "property"}},
    {"car_service", {"tires_brakes", "fuel", "battery", "maintenance", "car_wash"}},
    {"health", {"hospital", "clinic", "pharmacy", "dental", "checkup"}},
    {"shopping", {"sports", "clothing", "household", "department_store", "electronics"}},
  };
  return kSubcategories;
}

bool isKnownCategory(const std::string& category) {
  const auto& all = categories();
  return std::find(all.begin(), all.end(), category) != all.end();
}

std::string normalizeCategory(const std::string& label) {
  return isKnownCategory(label) ? label : kDefaultCategory;
}

std::optional<std::string> normalizeSubcategory(const std::string& category,
                                                const std::optional<std::string>& label) {
  if (!label || label->empty()) return std::nullopt;

  const auto& all = subcategories();
  auto it = all.find(category);
  if (it == all.end()) return std::nullopt;

  const auto& allowed = it->second;
  if (std::find(allowed.begin(), allowed.end(), *label) == allowed.end()) {
    return std::nullopt;
  }
  return label;
}

}  // namespace statement_recon
