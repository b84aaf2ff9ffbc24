#ifndef STATEMENT_MATCHER_HPP_
#define STATEMENT_MATCHER_HPP_

#include "statement_store.hpp"

#include <string>
#include <vector>

namespace statement_recon {
namespace reconcile {

/**
 * Stored statement of the same period whose total is close to the incoming one.
 */
struct MatchCandidate {
  Statement statement;
  double stored_total = 0.0;
  double diff_ratio = 0.0;
  bool issuer_match = false;  // advisory only
};

/**
 * Fuzzy statement-level duplicate check: same period, positive totals within
 * a relative tolerance. The issuer is reported but never filters.
 */
class StatementMatcher {
 public:
  static constexpr double kDefaultTolerance = 0.05;

  explicit StatementMatcher(StatementStore& store);

  std::vector<MatchCandidate> findSimilar(const std::string& issuer,
                                          const std::string& period,
                                          double total_amount,
                                          double tolerance = kDefaultTolerance);

  /**
   * |incoming - stored| / max(|stored|, 1).
   */
  static double diffRatio(double incoming, double stored);

 private:
  StatementStore& store_;
};

}  // namespace reconcile
}  // namespace statement_recon

#endif  // STATEMENT_MATCHER_HPP_
