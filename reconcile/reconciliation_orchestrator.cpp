#include "reconcile/reconciliation_orchestrator.hpp"
#include "extraction/page_extraction.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"
#include "reconcile/consensus.hpp"
#include "reconcile/fingerprint_index.hpp"

#include <algorithm>
#include <future>
#include <iomanip>
#include <iterator>
#include <map>
#include <random>
#include <sstream>

namespace statement_recon {
namespace reconcile {

using observability::LogLevel;

namespace {

const char* const kComponent = "reconciliation";

std::string newCorrelationId() {
  std::random_device rd;
  std::mt19937_64 gen(rd());
  std::stringstream ss;
  ss << std::hex << std::setw(16) << std::setfill('0') << gen();
  return ss.str();
}

std::string formatPercent(double ratio) {
  std::stringstream ss;
  ss << std::fixed << std::setprecision(1) << ratio * 100.0 << "%";
  return ss.str();
}

std::string describe(const Statement& statement) {
  std::stringstream ss;
  ss << "statement #" << statement.id << " (" << joinList(statement.filenames, ", ");
  if (!statement.issuer.empty()) ss << ", " << statement.issuer;
  ss << ", imported " << statement.imported_at << ")";
  return ss.str();
}

// Rows without a description are never stored, so they take no part in the
// checks either.
size_t dropBlankDescriptions(std::vector<Transaction>& transactions) {
  size_t before = transactions.size();
  transactions.erase(std::remove_if(transactions.begin(), transactions.end(),
                                    [](const Transaction& tx) {
                                      return trim(tx.description).empty();
                                    }),
                     transactions.end());
  return before - transactions.size();
}

void removeIssues(std::vector<Issue>& issues, IssueKind kind) {
  issues.erase(std::remove_if(issues.begin(), issues.end(),
                              [kind](const Issue& issue) { return issue.kind == kind; }),
               issues.end());
}

}  // namespace

std::string toString(SessionState state) {
  switch (state) {
    case SessionState::CHECKING_FINGERPRINT: return "CHECKING_FINGERPRINT";
    case SessionState::CHECKING_FUZZY: return "CHECKING_FUZZY";
    case SessionState::AWAITING_CONFIRMATION: return "AWAITING_CONFIRMATION";
    case SessionState::COMMITTED: return "COMMITTED";
    case SessionState::REJECTED_DUPLICATE: return "REJECTED_DUPLICATE";
    case SessionState::CANCELLED: return "CANCELLED";
    default: return "UNKNOWN";
  }
}

std::string toString(IssueKind kind) {
  switch (kind) {
    case IssueKind::EXACT_DUPLICATE_FILE: return "EXACT_DUPLICATE_FILE";
    case IssueKind::FUZZY_STATEMENT_OVERLAP: return "FUZZY_STATEMENT_OVERLAP";
    case IssueKind::FUZZY_TRANSACTION_OVERLAP: return "FUZZY_TRANSACTION_OVERLAP";
    case IssueKind::COMMIT_FAILURE: return "COMMIT_FAILURE";
    case IssueKind::EXTRACTION_PARTIAL_FAILURE: return "EXTRACTION_PARTIAL_FAILURE";
    default: return "UNKNOWN";
  }
}

std::string ReconciliationSession::effectiveIssuer() const {
  if (!issuer.empty()) return issuer;
  return suggested_issuer.value_or("");
}

bool ReconciliationSession::hasIssue(IssueKind kind) const {
  return std::any_of(issues.begin(), issues.end(),
                     [kind](const Issue& issue) { return issue.kind == kind; });
}

struct ReconciliationOrchestrator::FileExtraction {
  std::vector<Transaction> transactions;
  ConsensusResult consensus;
  size_t failed_pages = 0;
  size_t stale_rows = 0;
};

ReconciliationOrchestrator::ReconciliationOrchestrator(StatementStore& store,
                                                       extraction::ExtractionService& extractor,
                                                       extraction::TransactionLabeler* labeler,
                                                       const Config& config)
    : store_(store), extractor_(extractor), labeler_(labeler), config_(config) {
}

ReconciliationSession ReconciliationOrchestrator::ingest(
    const std::vector<extraction::UploadedFile>& files, const std::string& issuer) const {
  auto& metrics = observability::getGlobalMetrics();

  ReconciliationSession session;
  session.correlation_id = newCorrelationId();
  session.issuer = trim(issuer);
  session.state = SessionState::CHECKING_FINGERPRINT;

  RECON_LOG_BUILDER(LogLevel::INFO, "Ingestion started", kComponent, session.correlation_id)
      .field("files", files.size())
      .field("issuer", session.issuer);

  FingerprintIndex index(store_);
  std::vector<const extraction::UploadedFile*> accepted;
  std::map<std::string, std::string> batch_fingerprints;  // fingerprint -> accepted filename

  for (const auto& file : files) {
    metrics.incrementCounter("files_fingerprinted_total");

    std::string fp;
    try {
      fp = FingerprintIndex::fingerprint(file.content);
    } catch (const std::exception& e) {
      RECON_LOG_BUILDER(LogLevel::ERROR, "Fingerprint failed, skipping duplicate check",
                        kComponent, session.correlation_id)
          .field("file", file.filename)
          .field("error", e.what());
    }

    if (auto duplicate = index.findDuplicate(fp)) {
      metrics.incrementCounter("exact_duplicates_total");
      session.issues.push_back({IssueKind::EXACT_DUPLICATE_FILE,
                                file.filename + " was already imported as " + describe(*duplicate),
                                file.filename, duplicate->id});
      RECON_LOG_BUILDER(LogLevel::WARN, "Exact duplicate file rejected", kComponent,
                        session.correlation_id)
          .field("file", file.filename)
          .field("statement_id", static_cast<long long>(duplicate->id));
      continue;
    }

    auto earlier = fp.empty() ? batch_fingerprints.end() : batch_fingerprints.find(fp);
    if (earlier != batch_fingerprints.end()) {
      metrics.incrementCounter("exact_duplicates_total");
      session.issues.push_back({IssueKind::EXACT_DUPLICATE_FILE,
                                file.filename + " has the same content as " + earlier->second +
                                    " in this batch",
                                file.filename, std::nullopt});
      RECON_LOG_BUILDER(LogLevel::WARN, "Repeated file in batch rejected", kComponent,
                        session.correlation_id)
          .field("file", file.filename)
          .field("same_as", earlier->second);
      continue;
    }

    session.filenames.push_back(file.filename);
    if (!fp.empty()) {
      session.fingerprints.push_back(fp);
      batch_fingerprints.emplace(fp, file.filename);
    }
    accepted.push_back(&file);
  }

  if (accepted.empty()) {
    session.state = files.empty() ? SessionState::CANCELLED : SessionState::REJECTED_DUPLICATE;
    RECON_LOG_BUILDER(LogLevel::INFO, "Nothing left to ingest", kComponent, session.correlation_id)
        .field("state", toString(session.state));
    return session;
  }

  std::vector<ConsensusResult> per_file;
  for (const auto* file : accepted) {
    FileExtraction extracted = extractFile(*file, session.correlation_id);

    session.failed_pages += extracted.failed_pages;
    session.stale_rows_filtered += extracted.stale_rows;
    per_file.push_back(extracted.consensus);
    session.pending.insert(session.pending.end(),
                           std::make_move_iterator(extracted.transactions.begin()),
                           std::make_move_iterator(extracted.transactions.end()));

    if (extracted.failed_pages > 0) {
      session.issues.push_back({IssueKind::EXTRACTION_PARTIAL_FAILURE,
                                std::to_string(extracted.failed_pages) + " page(s) of " +
                                    file->filename + " could not be read",
                                file->filename, std::nullopt});
    }
  }

  ConsensusResult batch = combine(per_file);
  session.cutoff_day = batch.cutoff_day;
  session.suggested_issuer = batch.suggested_issuer;
  session.state = SessionState::CHECKING_FUZZY;
  metrics.setGauge("pending_transactions", static_cast<double>(session.pending.size()));

  RECON_LOG_BUILDER(LogLevel::INFO, "Extraction finished", kComponent, session.correlation_id)
      .field("files", session.filenames.size())
      .field("transactions", session.pending.size())
      .field("failed_pages", session.failed_pages)
      .field("stale_rows_filtered", session.stale_rows_filtered)
      .field("suggested_issuer", session.suggested_issuer.value_or(""));
  return session;
}

ReconciliationOrchestrator::FileExtraction ReconciliationOrchestrator::extractFile(
    const extraction::UploadedFile& file, const std::string& correlation_id) const {
  auto& metrics = observability::getGlobalMetrics();
  FileExtraction result;

  size_t page_count = 0;
  try {
    page_count = extractor_.pageCount(file);
  } catch (const std::exception& e) {
    result.failed_pages = 1;
    metrics.incrementCounter("extraction_failed_pages_total");
    RECON_LOG_BUILDER(LogLevel::ERROR, "Could not open document", kComponent, correlation_id)
        .field("file", file.filename)
        .field("error", e.what());
    return result;
  }

  std::vector<std::future<nlohmann::json>> calls;
  calls.reserve(page_count);
  for (size_t i = 0; i < page_count; ++i) {
    calls.push_back(std::async(std::launch::async, [this, &file, i]() {
      return extractor_.extractPage(file, i);
    }));
  }

  // Reduced strictly in page order, whatever order the calls complete in.
  std::vector<extraction::PageExtraction> pages;
  std::vector<extraction::ExtractedRow> rows;
  for (size_t i = 0; i < calls.size(); ++i) {
    try {
      extraction::PageExtraction page = extraction::parsePageExtraction(calls[i].get(),
                                                                        correlation_id);
      rows.insert(rows.end(), page.rows.begin(), page.rows.end());
      pages.push_back(std::move(page));
    } catch (const std::exception& e) {
      ++result.failed_pages;
      metrics.incrementCounter("extraction_failed_pages_total");
      RECON_LOG_BUILDER(LogLevel::WARN, "Page extraction failed", kComponent, correlation_id)
          .field("file", file.filename)
          .field("page", i)
          .field("error", e.what());
    }
  }

  result.consensus = aggregate(pages);

  rows = extraction::dropPayments(std::move(rows));
  result.stale_rows = extraction::dropStaleRows(rows, currentYear(), config_.recency_years);
  if (result.stale_rows > 0) {
    RECON_LOG_BUILDER(LogLevel::INFO, "Filtered rows outside the recency window", kComponent,
                      correlation_id)
        .field("file", file.filename)
        .field("rows", result.stale_rows)
        .field("recency_years", config_.recency_years);
  }

  result.transactions = extraction::toTransactions(rows);
  extraction::applyLabels(result.transactions, labeler_, correlation_id);
  return result;
}

ReconciliationSession ReconciliationOrchestrator::reconcile(ReconciliationSession session) const {
  if (session.state != SessionState::CHECKING_FUZZY) {
    RECON_LOG_BUILDER(LogLevel::WARN, "reconcile() ignored", kComponent, session.correlation_id)
        .field("state", toString(session.state));
    return session;
  }

  auto& metrics = observability::getGlobalMetrics();

  size_t blank = dropBlankDescriptions(session.pending);
  if (blank > 0) {
    RECON_LOG_BUILDER(LogLevel::INFO, "Dropped rows without a description", kComponent,
                      session.correlation_id)
        .field("rows", blank);
  }

  std::string period = estimatePeriod(session.pending).value_or("");
  double total = positiveTotal(session.pending);
  std::string issuer = session.effectiveIssuer();
  const std::string& correlation_id = session.correlation_id;

  {
    observability::MetricsCollector::Timer timer(metrics, "fuzzy_check_duration_seconds");

    auto matches = std::async(std::launch::async, [&]() {
      try {
        return StatementMatcher(store_).findSimilar(issuer, period, total,
                                                    config_.amount_tolerance);
      } catch (const std::exception& e) {
        RECON_LOG_BUILDER(LogLevel::ERROR, "Statement matching failed", kComponent, correlation_id)
            .field("error", e.what());
        return std::vector<MatchCandidate>{};
      }
    });
    auto overlap = std::async(std::launch::async, [&]() {
      try {
        return OverlapDetector(store_, config_.amount_slack).findOverlap(session.pending);
      } catch (const std::exception& e) {
        RECON_LOG_BUILDER(LogLevel::ERROR, "Overlap detection failed", kComponent, correlation_id)
            .field("error", e.what());
        return OverlapResult{};
      }
    });

    session.statement_matches = matches.get();
    session.overlap = overlap.get();
  }

  removeIssues(session.issues, IssueKind::FUZZY_STATEMENT_OVERLAP);
  removeIssues(session.issues, IssueKind::FUZZY_TRANSACTION_OVERLAP);

  for (const auto& match : session.statement_matches) {
    metrics.incrementCounter("statement_overlap_warnings_total");
    std::stringstream message;
    message << "Period " << period << " already has " << describe(match.statement)
            << " with total " << std::fixed << std::setprecision(2) << match.stored_total
            << " (difference " << formatPercent(match.diff_ratio) << ")";
    if (match.issuer_match) message << " from the same issuer";
    session.issues.push_back({IssueKind::FUZZY_STATEMENT_OVERLAP, message.str(), "",
                              match.statement.id});
  }

  const OverlapResult& overlap = session.overlap;
  if (overlap.positive_total > 0 && overlap.overlap_ratio >= config_.soft_overlap_threshold) {
    metrics.incrementCounter("transaction_overlap_warnings_total");
    session.issues.push_back({IssueKind::FUZZY_TRANSACTION_OVERLAP,
                              std::to_string(overlap.soft_count) + " of " +
                                  std::to_string(overlap.positive_total) +
                                  " expenses already exist with the same date and amount (" +
                                  std::to_string(overlap.exact_count) + " with the same description)",
                              "", std::nullopt});
  }

  RECON_LOG_BUILDER(LogLevel::INFO, "Fuzzy checks finished", kComponent, correlation_id)
      .field("period", period)
      .field("total", total)
      .field("statement_matches", session.statement_matches.size())
      .field("soft_overlap", overlap.soft_count)
      .field("exact_overlap", overlap.exact_count)
      .field("overlap_ratio", overlap.overlap_ratio);

  if (session.hasIssue(IssueKind::FUZZY_STATEMENT_OVERLAP) ||
      session.hasIssue(IssueKind::FUZZY_TRANSACTION_OVERLAP)) {
    session.state = SessionState::AWAITING_CONFIRMATION;
    return session;
  }

  return commit(std::move(session));
}

ReconciliationSession ReconciliationOrchestrator::confirm(ReconciliationSession session) const {
  if (session.state != SessionState::AWAITING_CONFIRMATION) {
    RECON_LOG_BUILDER(LogLevel::WARN, "confirm() ignored", kComponent, session.correlation_id)
        .field("state", toString(session.state));
    return session;
  }

  RECON_LOG_BUILDER(LogLevel::INFO, "Import confirmed despite warnings", kComponent,
                    session.correlation_id)
      .field("warnings", session.issues.size());
  return commit(std::move(session));
}

ReconciliationSession ReconciliationOrchestrator::cancel(ReconciliationSession session) const {
  if (session.state != SessionState::CHECKING_FUZZY &&
      session.state != SessionState::AWAITING_CONFIRMATION) {
    RECON_LOG_BUILDER(LogLevel::WARN, "cancel() ignored", kComponent, session.correlation_id)
        .field("state", toString(session.state));
    return session;
  }

  auto& metrics = observability::getGlobalMetrics();
  metrics.incrementCounter("sessions_cancelled_total");
  metrics.setGauge("pending_transactions", 0);
  RECON_LOG_BUILDER(LogLevel::INFO, "Import cancelled", kComponent, session.correlation_id)
      .field("discarded_transactions", session.pending.size());

  session.pending.clear();
  session.state = SessionState::CANCELLED;
  return session;
}

ReconciliationSession ReconciliationOrchestrator::commit(ReconciliationSession session) const {
  auto& metrics = observability::getGlobalMetrics();

  StatementDraft draft;
  draft.filenames = session.filenames;
  draft.issuer = session.effectiveIssuer();
  draft.cutoff_day = session.cutoff_day;
  draft.fingerprints = session.fingerprints;
  dropBlankDescriptions(session.pending);
  draft.transactions = session.pending;

  try {
    session.committed = store_.createStatement(draft);
  } catch (const StorageError& e) {
    metrics.incrementCounter("commit_failures_total");
    session.issues.push_back({IssueKind::COMMIT_FAILURE,
                              std::string("Could not save the statement: ") + e.what(), "",
                              std::nullopt});
    RECON_LOG_BUILDER(LogLevel::ERROR, "Commit failed", kComponent, session.correlation_id)
        .field("error", e.what());
    return session;
  }

  metrics.incrementCounter("commits_total");
  metrics.setGauge("pending_transactions", 0);
  session.state = SessionState::COMMITTED;
  RECON_LOG_BUILDER(LogLevel::INFO, "Statement committed", kComponent, session.correlation_id)
      .field("statement_id", static_cast<long long>(session.committed->id))
      .field("period", session.committed->period)
      .field("transactions", session.committed->tx_count);
  return session;
}

}  // namespace reconcile
}  // namespace statement_recon
