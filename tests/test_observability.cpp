#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace statement_recon::observability;

// Test fixture capturing logger output
class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Logger::getInstance().setOutputStream(output_);
    Logger::getInstance().setLogLevel(LogLevel::INFO);
  }

  void TearDown() override {
    Logger::getInstance().setOutputStream(std::cout);
  }

  std::ostringstream output_;
};

TEST_F(LoggerTest, WritesOneJsonLinePerEntry) {
  RECON_LOG_INFO("Statement stored", "persistence");

  std::string line = output_.str();
  EXPECT_NE(line.find("\"level\":\"INFO\""), std::string::npos);
  EXPECT_NE(line.find("\"message\":\"Statement stored\""), std::string::npos);
  EXPECT_NE(line.find("\"component\":\"persistence\""), std::string::npos);
  EXPECT_EQ(line.back(), '\n');
}

TEST_F(LoggerTest, BuilderAddsFieldsAndCorrelationId) {
  RECON_LOG_BUILDER(LogLevel::WARN, "Duplicate", "reconciliation", "abc123")
      .field("file", "may \"final\".pdf")
      .field("rows", 3)
      .field("confirmed", false);

  std::string line = output_.str();
  EXPECT_NE(line.find("\"correlation_id\":\"abc123\""), std::string::npos);
  EXPECT_NE(line.find("\"file\":\"may \\\"final\\\".pdf\""), std::string::npos);
  EXPECT_NE(line.find("\"rows\":3"), std::string::npos);
  EXPECT_NE(line.find("\"confirmed\":false"), std::string::npos);
}

TEST_F(LoggerTest, EntriesBelowLevelAreDropped) {
  Logger::getInstance().setLogLevel(LogLevel::ERROR);
  RECON_LOG_WARN("ignored", "test");
  EXPECT_TRUE(output_.str().empty());

  RECON_LOG_ERROR("kept", "test");
  EXPECT_FALSE(output_.str().empty());
}

TEST(MetricsTest, CountersAndHistograms) {
  MetricsCollector metrics;
  metrics.incrementCounter("commits_total");
  metrics.incrementCounter("commits_total", 2.0);
  metrics.observeHistogram("fuzzy_check_duration_seconds", 0.003);
  metrics.observeHistogram("fuzzy_check_duration_seconds", 0.2);

  EXPECT_DOUBLE_EQ(metrics.counterValue("commits_total"), 3.0);
  EXPECT_DOUBLE_EQ(metrics.counterValue("unknown_total"), 0.0);
  EXPECT_EQ(metrics.histogramCount("fuzzy_check_duration_seconds"), 2u);

  std::string exported = metrics.exportMetrics();
  EXPECT_NE(exported.find("# TYPE commits_total counter"), std::string::npos);
  EXPECT_NE(exported.find("commits_total 3"), std::string::npos);
  EXPECT_NE(exported.find("fuzzy_check_duration_seconds_count 2"), std::string::npos);
  EXPECT_NE(exported.find("fuzzy_check_duration_seconds_bucket{le=\"+Inf\"} 2"),
            std::string::npos);

  metrics.reset();
  EXPECT_DOUBLE_EQ(metrics.counterValue("commits_total"), 0.0);
}

TEST(MetricsTest, GaugesHoldTheLastValue) {
  MetricsCollector metrics;
  metrics.setGauge("pending_transactions", 12);
  metrics.setGauge("pending_transactions", 4);

  EXPECT_DOUBLE_EQ(metrics.gaugeValue("pending_transactions"), 4.0);
  EXPECT_NE(metrics.exportMetrics().find("# TYPE pending_transactions gauge"), std::string::npos);
}

TEST(MetricsTest, TimerRecordsOnScopeExit) {
  MetricsCollector metrics;
  {
    MetricsCollector::Timer timer(metrics, "step_seconds");
  }
  EXPECT_EQ(metrics.histogramCount("step_seconds"), 1u);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
