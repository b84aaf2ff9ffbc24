#ifndef CONSENSUS_HPP_
#define CONSENSUS_HPP_

#include "extraction/page_extraction.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace statement_recon {
namespace reconcile {

/**
 * Most frequent value; ties go to the value observed first. Empty input gives
 * nullopt.
 */
template <typename T>
std::optional<T> mostFrequent(const std::vector<T>& values) {
  // (value, count) in first-observed order
  std::vector<std::pair<T, size_t>> tally;
  for (const auto& value : values) {
    auto it = std::find_if(tally.begin(), tally.end(),
                           [&value](const std::pair<T, size_t>& entry) {
                             return entry.first == value;
                           });
    if (it == tally.end()) {
      tally.emplace_back(value, 1);
    } else {
      ++it->second;
    }
  }

  if (tally.empty()) return std::nullopt;

  auto best = tally.begin();
  for (auto it = tally.begin(); it != tally.end(); ++it) {
    if (it->second > best->second) best = it;
  }
  return best->first;
}

/**
 * Representative metadata of one document or batch.
 */
struct ConsensusResult {
  std::optional<int> cutoff_day;
  std::optional<std::string> issuer_name;
  std::optional<std::string> card_name;
  std::optional<std::string> suggested_issuer;
};

/**
 * Reduces per-page metadata, in page order, into one value per field.
 */
ConsensusResult aggregate(const std::vector<extraction::PageExtraction>& pages);

/**
 * Votes cutoff day and suggested issuer again over the per-file results of a
 * batch. Issuer and card names are not carried over.
 */
ConsensusResult combine(const std::vector<ConsensusResult>& per_file);

/**
 * "{issuer} {card}" when both are known, otherwise whichever is known.
 */
std::optional<std::string> composeSuggestion(const std::optional<std::string>& issuer_name,
                                              const std::optional<std::string>& card_name);

}  // namespace reconcile
}  // namespace statement_recon

#endif  // CONSENSUS_HPP_
