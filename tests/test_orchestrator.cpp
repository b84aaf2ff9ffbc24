#include "observability/logger.hpp"
#include "observability/metrics.hpp"
#include "reconcile/reconciliation_orchestrator.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace statement_recon;
using namespace statement_recon::reconcile;
using testing_support::page;
using testing_support::row;
using testing_support::thisYear;

namespace {

const int kThisYear = currentYear();

}  // namespace

// Test fixture wiring the orchestrator to an in-memory store and fake collaborators
class OrchestratorTest : public ::testing::Test {
 protected:
  OrchestratorTest() : orchestrator_(store_, extractor_, &labeler_, config_) {}

  ReconciliationSession run(const std::vector<extraction::UploadedFile>& files,
                            const std::string& issuer = "") {
    auto session = orchestrator_.ingest(files, issuer);
    return orchestrator_.reconcile(std::move(session));
  }

  // Single-page file with one expense per (date, amount) pair.
  extraction::UploadedFile addFile(const std::string& filename,
                                   const std::vector<std::pair<std::string, double>>& expenses) {
    std::vector<nlohmann::json> rows;
    for (const auto& e : expenses) {
      rows.push_back(row(e.first, "MERCHANT " + filename, e.second));
    }
    extractor_.addFile(filename, {page(rows)});
    return {filename, "content of " + filename};
  }

  ReconciliationOrchestrator::Config config_;
  InMemoryStatementStore store_;
  testing_support::FakeExtractionService extractor_;
  testing_support::FakeLabeler labeler_;
  ReconciliationOrchestrator orchestrator_;
};

// Scenario 1: fresh import
TEST_F(OrchestratorTest, FreshImportCommits) {
  labeler_.categories = {{"7-ELEVEN", "convenience_store"}};
  labeler_.subcategories = {{"7-ELEVEN", "7-eleven"}};
  extractor_.addFile("may.pdf", {
    page({row(thisYear("05-01"), "7-ELEVEN", 59.0),
          row(thisYear("05-03"), "PAYMENT - THANK YOU", -4000.0, true),
          row(thisYear("05-04"), "CASHBACK", -20.0)},
         20, "Kasikorn", "Visa Platinum"),
    page({row(thisYear("05-12"), "GRAB", 240.0)}, 20),
  });

  auto session = orchestrator_.ingest({{"may.pdf", "may bytes"}}, "");
  ASSERT_EQ(session.state, SessionState::CHECKING_FUZZY);
  EXPECT_FALSE(session.correlation_id.empty());
  ASSERT_EQ(session.pending.size(), 3u);  // payment removed
  EXPECT_EQ(session.pending[0].category, "convenience_store");
  EXPECT_EQ(session.pending[0].subcategory, "7-eleven");
  EXPECT_EQ(session.cutoff_day, 20);
  EXPECT_EQ(session.suggested_issuer, "Kasikorn Visa Platinum");
  EXPECT_EQ(session.effectiveIssuer(), "Kasikorn Visa Platinum");

  session = orchestrator_.reconcile(std::move(session));
  ASSERT_EQ(session.state, SessionState::COMMITTED);
  EXPECT_TRUE(session.issues.empty());
  ASSERT_TRUE(session.committed.has_value());

  const Statement& stored = *session.committed;
  EXPECT_EQ(stored.issuer, "Kasikorn Visa Platinum");
  EXPECT_EQ(stored.period, thisYear("05-12").substr(0, 7));
  EXPECT_EQ(stored.tx_count, 3);
  EXPECT_EQ(stored.cutoff_day, 20);
  EXPECT_EQ(stored.fingerprints.size(), 1u);
  EXPECT_EQ(store_.statementCount(), 1u);
  EXPECT_EQ(store_.transactionCount(), 3u);
}

// Scenario 2: the same bytes again
TEST_F(OrchestratorTest, ReimportOfSameBytesIsRejected) {
  auto file = addFile("may.pdf", {{thisYear("05-01"), 100.0}});
  ASSERT_EQ(run({file}).state, SessionState::COMMITTED);

  // Renaming the file does not matter, only its content does.
  extraction::UploadedFile renamed{"copy of may.pdf", file.content};
  extractor_.addFile(renamed.filename, {page({})});
  int calls_before = extractor_.calls.load();

  auto session = orchestrator_.ingest({renamed}, "Bank");
  EXPECT_EQ(session.state, SessionState::REJECTED_DUPLICATE);
  ASSERT_EQ(session.issues.size(), 1u);
  EXPECT_EQ(session.issues[0].kind, IssueKind::EXACT_DUPLICATE_FILE);
  EXPECT_EQ(session.issues[0].filename, "copy of may.pdf");
  EXPECT_EQ(session.issues[0].statement_id, 1);
  EXPECT_EQ(extractor_.calls.load(), calls_before);  // never extracted

  // Terminal: later steps leave it alone
  session = orchestrator_.reconcile(std::move(session));
  EXPECT_EQ(session.state, SessionState::REJECTED_DUPLICATE);
  EXPECT_EQ(store_.statementCount(), 1u);
  EXPECT_EQ(store_.transactionCount(), 1u);
}

TEST_F(OrchestratorTest, DuplicateFileOnlyStopsThatFile) {
  auto old_file = addFile("april.pdf", {{thisYear("04-01"), 100.0}});
  ASSERT_EQ(run({old_file}).state, SessionState::COMMITTED);

  auto new_file = addFile("june.pdf", {{thisYear("06-01"), 300.0}});
  auto session = run({old_file, new_file});

  EXPECT_EQ(session.state, SessionState::COMMITTED);
  EXPECT_TRUE(session.hasIssue(IssueKind::EXACT_DUPLICATE_FILE));
  ASSERT_TRUE(session.committed.has_value());
  EXPECT_EQ(session.committed->filenames, std::vector<std::string>({"june.pdf"}));
  EXPECT_EQ(session.committed->tx_count, 1);
}

// Scenario 3: same period, total within tolerance
TEST_F(OrchestratorTest, SimilarStatementNeedsConfirmation) {
  auto first = addFile("may-a.pdf", {{thisYear("05-02"), 600.0}, {thisYear("05-03"), 400.0}});
  ASSERT_EQ(run({first}, "Bank").state, SessionState::COMMITTED);

  auto second = addFile("may-b.pdf", {{thisYear("05-10"), 1030.0}});
  auto session = run({second}, "Bank");

  ASSERT_EQ(session.state, SessionState::AWAITING_CONFIRMATION);
  ASSERT_EQ(session.statement_matches.size(), 1u);
  EXPECT_TRUE(session.statement_matches[0].issuer_match);
  EXPECT_TRUE(session.hasIssue(IssueKind::FUZZY_STATEMENT_OVERLAP));
  EXPECT_FALSE(session.hasIssue(IssueKind::FUZZY_TRANSACTION_OVERLAP));
  EXPECT_EQ(store_.statementCount(), 1u);

  session = orchestrator_.confirm(std::move(session));
  EXPECT_EQ(session.state, SessionState::COMMITTED);
  EXPECT_EQ(store_.statementCount(), 2u);
  EXPECT_EQ(store_.transactionCount(), 3u);
}

TEST_F(OrchestratorTest, CancelWritesNothing) {
  auto first = addFile("may-a.pdf", {{thisYear("05-02"), 1000.0}});
  ASSERT_EQ(run({first}).state, SessionState::COMMITTED);

  auto second = addFile("may-b.pdf", {{thisYear("05-10"), 990.0}});
  auto session = run({second});
  ASSERT_EQ(session.state, SessionState::AWAITING_CONFIRMATION);

  session = orchestrator_.cancel(std::move(session));
  EXPECT_EQ(session.state, SessionState::CANCELLED);
  EXPECT_TRUE(session.pending.empty());
  EXPECT_EQ(store_.statementCount(), 1u);
  EXPECT_EQ(store_.transactionCount(), 1u);

  // A cancelled session cannot be confirmed afterwards
  session = orchestrator_.confirm(std::move(session));
  EXPECT_EQ(session.state, SessionState::CANCELLED);
  EXPECT_EQ(store_.statementCount(), 1u);
}

// Scenario 4: transaction-level overlap without a statement match
TEST_F(OrchestratorTest, SoftOverlapNeedsConfirmation) {
  std::vector<std::pair<std::string, double>> january;
  for (int day = 1; day <= 6; ++day) {
    january.emplace_back(thisYear("01-0" + std::to_string(day)), 100.0 * day);
  }
  ASSERT_EQ(run({addFile("january.pdf", january)}).state, SessionState::COMMITTED);

  // Six repeats from January plus four February expenses; the batch period is February.
  std::vector<std::pair<std::string, double>> batch = january;
  for (int day = 1; day <= 4; ++day) {
    batch.emplace_back(thisYear("02-0" + std::to_string(day)), 50.0);
  }
  auto session = run({addFile("overlap.pdf", batch)});

  ASSERT_EQ(session.state, SessionState::AWAITING_CONFIRMATION);
  EXPECT_TRUE(session.statement_matches.empty());
  EXPECT_EQ(session.overlap.positive_total, 10u);
  EXPECT_EQ(session.overlap.soft_count, 6u);
  EXPECT_DOUBLE_EQ(session.overlap.overlap_ratio, 0.6);
  EXPECT_TRUE(session.hasIssue(IssueKind::FUZZY_TRANSACTION_OVERLAP));
  EXPECT_FALSE(session.hasIssue(IssueKind::FUZZY_STATEMENT_OVERLAP));
}

TEST_F(OrchestratorTest, OverlapBelowThresholdCommits) {
  std::vector<std::pair<std::string, double>> january = {{thisYear("01-01"), 100.0}};
  ASSERT_EQ(run({addFile("january.pdf", january)}).state, SessionState::COMMITTED);

  std::vector<std::pair<std::string, double>> batch = january;
  batch.emplace_back(thisYear("02-01"), 10.0);
  batch.emplace_back(thisYear("02-02"), 20.0);
  auto session = run({addFile("batch.pdf", batch)});

  EXPECT_EQ(session.state, SessionState::COMMITTED);
  EXPECT_EQ(session.overlap.soft_count, 1u);
}

TEST_F(OrchestratorTest, FailedPagesAreReportedAndSkipped) {
  extractor_.addFile("scan.pdf", {
    page({row(thisYear("03-01"), "A", 10.0)}, 15),
    std::nullopt,
    nlohmann::json("not a page"),
    page({row(thisYear("03-02"), "B", 20.0)}, 15),
  });

  auto session = orchestrator_.ingest({{"scan.pdf", "scan"}}, "Bank");
  ASSERT_EQ(session.state, SessionState::CHECKING_FUZZY);
  EXPECT_EQ(session.failed_pages, 2u);
  EXPECT_EQ(session.pending.size(), 2u);
  EXPECT_TRUE(session.hasIssue(IssueKind::EXTRACTION_PARTIAL_FAILURE));

  // Informational only
  session = orchestrator_.reconcile(std::move(session));
  EXPECT_EQ(session.state, SessionState::COMMITTED);
}

TEST_F(OrchestratorTest, UnreadableDocumentContributesNothing) {
  auto session = orchestrator_.ingest({{"missing.pdf", "???"}}, "Bank");

  EXPECT_EQ(session.state, SessionState::CHECKING_FUZZY);
  EXPECT_TRUE(session.pending.empty());
  EXPECT_EQ(session.failed_pages, 1u);
}

TEST_F(OrchestratorTest, PageOrderIsDeterministic) {
  extractor_.delay_first_pages = true;
  extractor_.addFile("long.pdf", {
    page({row(thisYear("03-01"), "FIRST", 1.0)}, 10, "Bank A"),
    page({row(thisYear("03-02"), "SECOND", 2.0)}, 20, "Bank B"),
    page({row(thisYear("03-03"), "THIRD", 3.0)}, 30, "Bank C"),
  });

  auto session = orchestrator_.ingest({{"long.pdf", "long"}}, "");
  ASSERT_EQ(session.pending.size(), 3u);
  EXPECT_EQ(session.pending[0].description, "FIRST");
  EXPECT_EQ(session.pending[2].description, "THIRD");
  // All distinct: the first observed value wins
  EXPECT_EQ(session.cutoff_day, 10);
  EXPECT_EQ(session.suggested_issuer, "Bank A");
}

TEST_F(OrchestratorTest, StaleRowsAreFiltered) {
  extractor_.addFile("sample.pdf", {
    page({row(thisYear("03-01"), "REAL", 10.0),
          row(std::to_string(kThisYear - 10) + "-01-01", "SAMPLE ROW", 99.0)}),
  });

  auto session = orchestrator_.ingest({{"sample.pdf", "sample"}}, "Bank");
  ASSERT_EQ(session.pending.size(), 1u);
  EXPECT_EQ(session.pending[0].description, "REAL");
  EXPECT_EQ(session.stale_rows_filtered, 1u);
}

TEST_F(OrchestratorTest, UserIssuerWinsOverSuggestion) {
  extractor_.addFile("may.pdf", {page({row(thisYear("05-01"), "A", 10.0)}, 20, "SCB")});

  auto session = run({{"may.pdf", "may"}}, "  My SCB card ");
  ASSERT_EQ(session.state, SessionState::COMMITTED);
  EXPECT_EQ(session.suggested_issuer, "SCB");
  EXPECT_EQ(session.committed->issuer, "My SCB card");
}

TEST_F(OrchestratorTest, BatchConsensusAcrossFiles) {
  extractor_.addFile("a.pdf", {page({row(thisYear("05-01"), "A", 10.0)}, 15, "Krungsri")});
  extractor_.addFile("b.pdf", {page({row(thisYear("05-02"), "B", 20.0)}, 25, "Citi")});
  extractor_.addFile("c.pdf", {page({row(thisYear("05-03"), "C", 30.0)}, 25, "Citi")});

  auto session = run({{"a.pdf", "a"}, {"b.pdf", "b"}, {"c.pdf", "c"}});
  ASSERT_EQ(session.state, SessionState::COMMITTED);
  EXPECT_EQ(session.committed->cutoff_day, 25);
  EXPECT_EQ(session.committed->issuer, "Citi");
  EXPECT_EQ(session.committed->filenames.size(), 3u);
  EXPECT_EQ(session.committed->fingerprints.size(), 3u);
  EXPECT_EQ(session.committed->tx_count, 3);
}

TEST_F(OrchestratorTest, BlankDescriptionsAreNotStored) {
  extractor_.addFile("may.pdf", {page({row(thisYear("05-01"), "A", 10.0),
                                       row(thisYear("05-02"), "   ", 20.0)})});

  auto session = run({{"may.pdf", "may"}});
  ASSERT_EQ(session.state, SessionState::COMMITTED);
  EXPECT_EQ(session.committed->tx_count, 1);
  EXPECT_EQ(store_.transactionCount(), 1u);
}

TEST_F(OrchestratorTest, BlankRowsDoNotShiftTheCheckedPeriod) {
  const std::string may = thisYear("05-01").substr(0, 7);
  extractor_.addFile("a.pdf", {page({row(thisYear("05-02"), "SHOP", 1000.0)})});
  ASSERT_EQ(run({{"a.pdf", "a"}}, "Bank").state, SessionState::COMMITTED);

  // A later-dated row without a description must not move the period to June.
  extractor_.addFile("b.pdf", {page({row(thisYear("05-03"), "SHOP X", 1000.0),
                                     row(thisYear("06-01"), "", 5.0)})});
  auto session = run({{"b.pdf", "b"}}, "Bank");

  ASSERT_EQ(session.state, SessionState::AWAITING_CONFIRMATION);
  ASSERT_EQ(session.statement_matches.size(), 1u);
  EXPECT_EQ(session.statement_matches[0].statement.period, may);
  EXPECT_DOUBLE_EQ(session.statement_matches[0].diff_ratio, 0.0);
  ASSERT_EQ(session.pending.size(), 1u);
  EXPECT_EQ(session.overlap.total, 1u);

  session = orchestrator_.confirm(std::move(session));
  ASSERT_EQ(session.state, SessionState::COMMITTED);
  EXPECT_EQ(session.committed->period, may);
  EXPECT_EQ(session.committed->tx_count, 1);
}

TEST_F(OrchestratorTest, UnreadableDateDoesNotBecomeThePeriod) {
  extractor_.addFile("may.pdf", {page({row(thisYear("05-02"), "SHOP", 1000.0),
                                       row("N/A", "FEE", 10.0)})});

  auto session = run({{"may.pdf", "may"}}, "Bank");
  ASSERT_EQ(session.state, SessionState::COMMITTED);
  EXPECT_EQ(session.committed->period, thisYear("05-02").substr(0, 7));
  EXPECT_EQ(session.committed->tx_count, 2);
}

TEST_F(OrchestratorTest, RepeatedFileInOneBatchIsRejected) {
  auto file = addFile("may.pdf", {{thisYear("05-01"), 100.0}});
  extractor_.addFile("may (1).pdf", {page({row(thisYear("05-01"), "MERCHANT may.pdf", 100.0)})});
  extraction::UploadedFile copy{"may (1).pdf", file.content};

  auto session = run({file, copy});
  ASSERT_EQ(session.state, SessionState::COMMITTED);
  ASSERT_EQ(session.issues.size(), 1u);
  EXPECT_EQ(session.issues[0].kind, IssueKind::EXACT_DUPLICATE_FILE);
  EXPECT_EQ(session.issues[0].filename, "may (1).pdf");
  EXPECT_FALSE(session.issues[0].statement_id.has_value());
  EXPECT_EQ(session.committed->filenames, std::vector<std::string>({"may.pdf"}));
  EXPECT_EQ(session.committed->fingerprints.size(), 1u);
  EXPECT_EQ(store_.transactionCount(), 1u);
}

TEST_F(OrchestratorTest, CallerEditsBeforeReconcileAreCommitted) {
  extractor_.addFile("may.pdf", {page({row(thisYear("05-01"), "TOPS", 10.0)})});

  auto session = orchestrator_.ingest({{"may.pdf", "may"}}, "Bank");
  session.pending[0].amount = 12.5;
  session.pending[0].category = "supermarket";
  session = orchestrator_.reconcile(std::move(session));

  ASSERT_EQ(session.state, SessionState::COMMITTED);
  auto rows = store_.listTransactions(PeriodFilter::ALL);
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_DOUBLE_EQ(rows[0].transaction.amount, 12.5);
  EXPECT_EQ(rows[0].transaction.category, "supermarket");
}

TEST_F(OrchestratorTest, NoFilesMeansNothingToDo) {
  auto session = orchestrator_.ingest({}, "Bank");
  EXPECT_EQ(session.state, SessionState::CANCELLED);
  EXPECT_EQ(store_.statementCount(), 0u);
}

TEST_F(OrchestratorTest, StepsOutOfOrderAreIgnored) {
  auto file = addFile("may.pdf", {{thisYear("05-01"), 100.0}});
  auto session = orchestrator_.ingest({file}, "Bank");

  // confirm() is only valid once warnings were raised
  session = orchestrator_.confirm(std::move(session));
  EXPECT_EQ(session.state, SessionState::CHECKING_FUZZY);
  EXPECT_EQ(store_.statementCount(), 0u);

  session = orchestrator_.reconcile(std::move(session));
  ASSERT_EQ(session.state, SessionState::COMMITTED);

  session = orchestrator_.cancel(std::move(session));
  EXPECT_EQ(session.state, SessionState::COMMITTED);
  EXPECT_EQ(store_.statementCount(), 1u);
}

TEST_F(OrchestratorTest, MetricsFollowTheSession) {
  auto& metrics = observability::getGlobalMetrics();
  double fingerprinted = metrics.counterValue("files_fingerprinted_total");
  double duplicates = metrics.counterValue("exact_duplicates_total");
  double commits = metrics.counterValue("commits_total");
  size_t timed = metrics.histogramCount("fuzzy_check_duration_seconds");

  auto file = addFile("may.pdf", {{thisYear("05-01"), 100.0}});
  run({file});
  orchestrator_.ingest({file}, "");

  EXPECT_DOUBLE_EQ(metrics.counterValue("files_fingerprinted_total"), fingerprinted + 2);
  EXPECT_DOUBLE_EQ(metrics.counterValue("exact_duplicates_total"), duplicates + 1);
  EXPECT_DOUBLE_EQ(metrics.counterValue("commits_total"), commits + 1);
  EXPECT_EQ(metrics.histogramCount("fuzzy_check_duration_seconds"), timed + 1);
}

// Commit failures
class OrchestratorCommitFailureTest : public ::testing::Test {
 protected:
  OrchestratorCommitFailureTest()
      : store_(1), orchestrator_(store_, extractor_, nullptr, ReconciliationOrchestrator::Config{}) {
    extractor_.addFile("may.pdf", {page({row(thisYear("05-01"), "A", 10.0)})});
  }

  testing_support::FlakyStatementStore store_;
  testing_support::FakeExtractionService extractor_;
  ReconciliationOrchestrator orchestrator_;
};

TEST_F(OrchestratorCommitFailureTest, FailureIsReportedAndRetryable) {
  auto session = orchestrator_.ingest({{"may.pdf", "may"}}, "Bank");
  session = orchestrator_.reconcile(std::move(session));

  EXPECT_EQ(session.state, SessionState::CHECKING_FUZZY);
  EXPECT_TRUE(session.hasIssue(IssueKind::COMMIT_FAILURE));
  EXPECT_FALSE(session.committed.has_value());
  EXPECT_EQ(store_.statementCount(), 0u);
  EXPECT_EQ(store_.transactionCount(), 0u);

  session = orchestrator_.reconcile(std::move(session));
  EXPECT_EQ(session.state, SessionState::COMMITTED);
  EXPECT_EQ(store_.statementCount(), 1u);
}

TEST_F(OrchestratorCommitFailureTest, FailedSessionCanBeCancelled) {
  auto session = orchestrator_.reconcile(orchestrator_.ingest({{"may.pdf", "may"}}, "Bank"));
  ASSERT_TRUE(session.hasIssue(IssueKind::COMMIT_FAILURE));

  session = orchestrator_.cancel(std::move(session));
  EXPECT_EQ(session.state, SessionState::CANCELLED);
  EXPECT_EQ(store_.statementCount(), 0u);
}

TEST(OrchestratorConfigTest, ThresholdsAreConfigurable) {
  InMemoryStatementStore store;
  testing_support::FakeExtractionService extractor;
  ReconciliationOrchestrator::Config strict;
  strict.amount_tolerance = 0.0;
  strict.soft_overlap_threshold = 1.0;
  ReconciliationOrchestrator orchestrator(store, extractor, nullptr, strict);

  extractor.addFile("a.pdf", {page({row(thisYear("05-01"), "A", 1000.0)})});
  extractor.addFile("b.pdf", {page({row(thisYear("05-01"), "B", 1000.0),
                                    row(thisYear("05-02"), "C", 10.0)})});

  ASSERT_EQ(orchestrator.reconcile(orchestrator.ingest({{"a.pdf", "a"}}, "")).state,
            SessionState::COMMITTED);

  // Total 1010 vs 1000 and a 0.5 soft ratio both pass the strict settings.
  auto session = orchestrator.reconcile(orchestrator.ingest({{"b.pdf", "b"}}, ""));
  EXPECT_EQ(session.state, SessionState::COMMITTED);
  EXPECT_DOUBLE_EQ(session.overlap.overlap_ratio, 0.5);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  statement_recon::observability::Logger::getInstance().setLogLevel(
      statement_recon::observability::LogLevel::ERROR);
  return RUN_ALL_TESTS();
}
