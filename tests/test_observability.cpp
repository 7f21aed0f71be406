#include "../include/observability/logger.hpp"
#include "../include/observability/metrics.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <limits>
#include <sstream>
#include <string>

using statements::observability::LogLevel;
using statements::observability::Logger;

// Logger writes to a captured stream for the duration of each test
class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    previous_level_ = Logger::getInstance().getLogLevel();
    Logger::getInstance().setOutputStream(captured_);
    Logger::getInstance().setLogLevel(LogLevel::DEBUG);
  }

  void TearDown() override {
    Logger::getInstance().setOutputStream(std::clog);
    Logger::getInstance().setLogLevel(previous_level_);
  }

  std::ostringstream captured_;
  LogLevel previous_level_ = LogLevel::INFO;
};

TEST_F(LoggerTest, EmitsOneJsonObjectPerRecord) {
  Logger::getInstance().info("Statement \"written\"", "writer", "run-1");

  auto entry = nlohmann::json::parse(captured_.str());
  EXPECT_EQ(entry["level"], "INFO");
  EXPECT_EQ(entry["message"], "Statement \"written\"");
  EXPECT_EQ(entry["component"], "writer");
  EXPECT_EQ(entry["correlation_id"], "run-1");
  EXPECT_TRUE(entry.contains("timestamp"));
  EXPECT_TRUE(entry.contains("thread"));
}

TEST_F(LoggerTest, BuilderAddsTypedFields) {
  {
    Logger::LogBuilder(LogLevel::WARN, "Transactions reference unknown accounts")
        .field("count", 2)
        .field("ratio", 0.5)
        .field("path", "log.txt")
        .field("fatal", false);
  }

  auto entry = nlohmann::json::parse(captured_.str());
  EXPECT_EQ(entry["level"], "WARN");
  EXPECT_EQ(entry["count"], 2);
  EXPECT_DOUBLE_EQ(entry["ratio"].get<double>(), 0.5);
  EXPECT_EQ(entry["path"], "log.txt");
  EXPECT_EQ(entry["fatal"], false);
}

TEST_F(LoggerTest, SizeFieldsKeepFullWidth) {
  const size_t large = static_cast<size_t>(std::numeric_limits<int>::max()) + 10;
  {
    Logger::LogBuilder(LogLevel::INFO, "Statement written").field("bytes", large);
  }

  auto entry = nlohmann::json::parse(captured_.str());
  EXPECT_EQ(entry["bytes"].get<size_t>(), large);
}

TEST_F(LoggerTest, RecordsBelowMinimumLevelAreDropped) {
  Logger::getInstance().setLogLevel(LogLevel::WARN);
  Logger::getInstance().info("hidden");
  STATEMENTS_LOG_DEBUG("hidden too");
  EXPECT_TRUE(captured_.str().empty());

  STATEMENTS_LOG_ERROR("shown");
  auto entry = nlohmann::json::parse(captured_.str());
  EXPECT_EQ(entry["message"], "shown");
  EXPECT_EQ(entry["component"], "TestBody");
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
  EXPECT_EQ(statements::observability::parseLogLevel("DEBUG"), LogLevel::DEBUG);
  EXPECT_EQ(statements::observability::parseLogLevel(" warn "), LogLevel::WARN);
  EXPECT_FALSE(statements::observability::parseLogLevel("verbose").has_value());
}

// Metrics tests
TEST(MetricsCollectorTest, CountersGaugesAndHistograms) {
  statements::observability::MetricsCollector metrics;
  metrics.describe("ledger_lines_dropped_total", "Ledger lines not matching the ledger pattern");
  metrics.incrementCounter("ledger_lines_dropped_total");
  metrics.incrementCounter("ledger_lines_dropped_total", 2);
  metrics.setGauge("statement_bytes_written", 512);
  {
    statements::observability::MetricsCollector::Timer timer(metrics, "statement_run_seconds");
  }

  EXPECT_DOUBLE_EQ(metrics.counterValue("ledger_lines_dropped_total"), 3.0);
  EXPECT_DOUBLE_EQ(metrics.gaugeValue("statement_bytes_written"), 512.0);
  EXPECT_EQ(metrics.histogramCount("statement_run_seconds"), 1u);

  const std::string text = metrics.exportMetrics();
  EXPECT_NE(text.find("# HELP ledger_lines_dropped_total Ledger lines not matching"), std::string::npos);
  EXPECT_NE(text.find("# TYPE statement_bytes_written gauge"), std::string::npos);
  EXPECT_NE(text.find("statement_run_seconds_bucket{le=\"+Inf\"} 1"), std::string::npos);

  metrics.reset();
  EXPECT_DOUBLE_EQ(metrics.counterValue("ledger_lines_dropped_total"), 0.0);
}
