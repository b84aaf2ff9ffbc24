#ifndef OVERLAP_DETECTOR_HPP_
#define OVERLAP_DETECTOR_HPP_

#include "statement_store.hpp"

#include <cstddef>
#include <vector>

namespace statement_recon {
namespace reconcile {

struct OverlapResult {
  size_t exact_count = 0;     // date, description and amount match
  size_t soft_count = 0;      // date and amount match
  double overlap_ratio = 0.0; // soft_count / positive_total, in [0, 1]
  size_t total = 0;           // candidates examined
  size_t positive_total = 0;  // candidates with amount > 0
};

/**
 * Transaction-level overlap check of a pending batch against every stored
 * transaction. Only expense rows (amount > 0) take part.
 */
class OverlapDetector {
 public:
  static constexpr double kDefaultAmountSlack = 1.0;

  explicit OverlapDetector(StatementStore& store, double amount_slack = kDefaultAmountSlack);

  OverlapResult findOverlap(const std::vector<Transaction>& candidates);

 private:
  bool matches(const TransactionProbe& probe);

  StatementStore& store_;
  double amount_slack_;
};

}  // namespace reconcile
}  // namespace statement_recon

#endif  // OVERLAP_DETECTOR_HPP_
