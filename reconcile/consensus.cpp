#include "reconcile/consensus.hpp"

namespace statement_recon {
namespace reconcile {

namespace {

void collect(std::vector<std::string>& out, const std::optional<std::string>& value) {
  if (value && !value->empty()) out.push_back(*value);
}

}  // namespace

std::optional<std::string> composeSuggestion(const std::optional<std::string>& issuer_name,
                                              const std::optional<std::string>& card_name) {
  bool has_issuer = issuer_name && !issuer_name->empty();
  bool has_card = card_name && !card_name->empty();

  if (has_issuer && has_card) return *issuer_name + " " + *card_name;
  if (has_issuer) return issuer_name;
  if (has_card) return card_name;
  return std::nullopt;
}

ConsensusResult aggregate(const std::vector<extraction::PageExtraction>& pages) {
  std::vector<int> cutoff_days;
  std::vector<std::string> issuer_names;
  std::vector<std::string> card_names;

  for (const auto& page : pages) {
    if (page.cutoff_day) cutoff_days.push_back(*page.cutoff_day);
    collect(issuer_names, page.issuer_name);
    collect(card_names, page.card_name);
  }

  ConsensusResult result;
  result.cutoff_day = mostFrequent(cutoff_days);
  result.issuer_name = mostFrequent(issuer_names);
  result.card_name = mostFrequent(card_names);
  result.suggested_issuer = composeSuggestion(result.issuer_name, result.card_name);
  return result;
}

ConsensusResult combine(const std::vector<ConsensusResult>& per_file) {
  std::vector<int> cutoff_days;
  std::vector<std::string> suggestions;

  for (const auto& file : per_file) {
    if (file.cutoff_day) cutoff_days.push_back(*file.cutoff_day);
    collect(suggestions, file.suggested_issuer);
  }

  ConsensusResult result;
  result.cutoff_day = mostFrequent(cutoff_days);
  result.suggested_issuer = mostFrequent(suggestions);
  return result;
}

}  // namespace reconcile
}  // namespace statement_recon
