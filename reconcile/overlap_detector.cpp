#include "reconcile/overlap_detector.hpp"
#include "observability/logger.hpp"

namespace statement_recon {
namespace reconcile {

OverlapDetector::OverlapDetector(StatementStore& store, double amount_slack)
    : store_(store), amount_slack_(amount_slack) {
}

OverlapResult OverlapDetector::findOverlap(const std::vector<Transaction>& candidates) {
  OverlapResult result;
  result.total = candidates.size();

  for (const auto& tx : candidates) {
    if (tx.amount <= 0) continue;
    ++result.positive_total;

    TransactionProbe probe;
    probe.trans_date = tx.trans_date;
    probe.amount = tx.amount;
    probe.slack = amount_slack_;

    probe.description = tx.description;
    if (matches(probe)) ++result.exact_count;

    probe.description.reset();
    if (matches(probe)) ++result.soft_count;
  }

  if (result.positive_total == 0) {
    result.exact_count = 0;
    result.soft_count = 0;
    return result;
  }

  result.overlap_ratio =
      static_cast<double>(result.soft_count) / static_cast<double>(result.positive_total);
  return result;
}

bool OverlapDetector::matches(const TransactionProbe& probe) {
  try {
    return store_.hasMatchingTransaction(probe);
  } catch (const std::exception& e) {
    RECON_LOG_WARN("Overlap probe failed for " + probe.trans_date + ", treating as no match: " +
                       e.what(),
                   "overlap");
    return false;
  }
}

}  // namespace reconcile
}  // namespace statement_recon
