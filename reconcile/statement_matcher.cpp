#include "reconcile/statement_matcher.hpp"

#include <algorithm>
#include <cmath>

namespace statement_recon {
namespace reconcile {

StatementMatcher::StatementMatcher(StatementStore& store)
    : store_(store) {
}

double StatementMatcher::diffRatio(double incoming, double stored) {
  return std::fabs(incoming - stored) / std::max(std::fabs(stored), 1.0);
}

std::vector<MatchCandidate> StatementMatcher::findSimilar(const std::string& issuer,
                                                          const std::string& period,
                                                          double total_amount,
                                                          double tolerance) {
  std::vector<MatchCandidate> matches;
  if (period.empty()) return matches;

  for (auto& entry : store_.statementTotalsForPeriod(period)) {
    MatchCandidate candidate;
    candidate.stored_total = entry.positive_total;
    candidate.issuer_match = entry.statement.issuer == issuer;

    if (entry.positive_total == 0.0) {
      // An empty stored statement only matches an equally empty one.
      if (total_amount != 0.0) continue;
      candidate.diff_ratio = 0.0;
    } else {
      candidate.diff_ratio = diffRatio(total_amount, entry.positive_total);
      if (candidate.diff_ratio > tolerance) continue;
    }

    candidate.statement = std::move(entry.statement);
    matches.push_back(std::move(candidate));
  }

  return matches;
}

}  // namespace reconcile
}  // namespace statement_recon
