#ifndef RECONCILIATION_ORCHESTRATOR_HPP_
#define RECONCILIATION_ORCHESTRATOR_HPP_

#include "extraction/extraction_service.hpp"
#include "extraction/transaction_labeler.hpp"
#include "reconcile/overlap_detector.hpp"
#include "reconcile/statement_matcher.hpp"
#include "statement_store.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace statement_recon {
namespace reconcile {

enum class SessionState {
  CHECKING_FINGERPRINT,
  CHECKING_FUZZY,
  AWAITING_CONFIRMATION,
  COMMITTED,
  REJECTED_DUPLICATE,
  CANCELLED
};

enum class IssueKind {
  EXACT_DUPLICATE_FILE,
  FUZZY_STATEMENT_OVERLAP,
  FUZZY_TRANSACTION_OVERLAP,
  COMMIT_FAILURE,
  EXTRACTION_PARTIAL_FAILURE
};

std::string toString(SessionState state);
std::string toString(IssueKind kind);

/**
 * One reported condition. `filename` and `statement_id` are set when the issue
 * concerns a single file or stored statement.
 */
struct Issue {
  IssueKind kind;
  std::string message;
  std::string filename;
  std::optional<int64_t> statement_id;
};

/**
 * State of one ingestion request, passed by value between the steps.
 * `pending` may be edited by the caller before reconcile().
 */
struct ReconciliationSession {
  std::string correlation_id;
  SessionState state = SessionState::CHECKING_FINGERPRINT;

  std::string issuer;  // label entered by the user, may be empty
  std::optional<std::string> suggested_issuer;
  std::optional<int> cutoff_day;

  std::vector<std::string> filenames;     // files that passed the fingerprint check
  std::vector<std::string> fingerprints;  // one per fingerprinted file
  std::vector<Transaction> pending;

  std::vector<Issue> issues;
  std::vector<MatchCandidate> statement_matches;
  OverlapResult overlap;

  std::optional<Statement> committed;
  size_t failed_pages = 0;
  size_t stale_rows_filtered = 0;

  // The user's label when given, else the extracted suggestion.
  std::string effectiveIssuer() const;

  bool hasIssue(IssueKind kind) const;
};

/**
 * Drives one batch from raw files to a committed statement.
 *
 *   ingest()    fingerprint, extract and aggregate -> CHECKING_FUZZY
 *   reconcile() fuzzy checks, then commit or wait -> COMMITTED / AWAITING_CONFIRMATION
 *   confirm()   commit after warnings               -> COMMITTED
 *   cancel()    drop the pending batch               -> CANCELLED
 *
 * Calls made from any other state return the session unchanged.
 */
class ReconciliationOrchestrator {
 public:
  struct Config {
    double amount_tolerance = StatementMatcher::kDefaultTolerance;
    double soft_overlap_threshold = 0.5;
    double amount_slack = OverlapDetector::kDefaultAmountSlack;
    int recency_years = 3;
  };

  ReconciliationOrchestrator(StatementStore& store,
                             extraction::ExtractionService& extractor,
                             extraction::TransactionLabeler* labeler,
                             const Config& config);

  ReconciliationSession ingest(const std::vector<extraction::UploadedFile>& files,
                               const std::string& issuer) const;
  ReconciliationSession reconcile(ReconciliationSession session) const;
  ReconciliationSession confirm(ReconciliationSession session) const;
  ReconciliationSession cancel(ReconciliationSession session) const;

  const Config& config() const { return config_; }

 private:
  struct FileExtraction;

  FileExtraction extractFile(const extraction::UploadedFile& file,
                             const std::string& correlation_id) const;
  ReconciliationSession commit(ReconciliationSession session) const;

  StatementStore& store_;
  extraction::ExtractionService& extractor_;
  extraction::TransactionLabeler* labeler_;
  Config config_;
};

}  // namespace reconcile
}  // namespace statement_recon

#endif  // RECONCILIATION_ORCHESTRATOR_HPP_
