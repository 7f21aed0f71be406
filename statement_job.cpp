#include "statement_job.hpp"

#include "account.hpp"
#include "observability/metrics.hpp"
#include "statement_renderer.hpp"
#include "summary_export.hpp"
#include "transaction.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace statements {

namespace fs = std::filesystem;

Report buildReport(std::string_view ledger_text, std::string_view transactions_text) {
  Report report;

  LedgerLoadResult ledger = loadAccounts(ledger_text);
  report.stats.accounts_loaded = ledger.accounts.size();
  report.stats.ledger_lines_dropped = ledger.lines_dropped;

  TransactionLogParseResult log = parseTransactions(transactions_text);
  report.stats.transactions_parsed = log.transactions.size();
  report.stats.unknown_type_transactions = log.unknown_type_count;
  report.stats.unparsed_account_transactions = log.unparsed_account_count;
  report.stats.malformed_amount_transactions = log.malformed_amount_count;

  report.groups = groupByAccount(log.transactions);
  report.reconciled = reconcileAll(ledger.accounts, report.groups);

  const std::vector<Transaction> unmatched = unmatchedTransactions(ledger.accounts, report.groups);
  report.stats.unmatched_transactions = unmatched.size();
  if (!unmatched.empty()) {
    STATEMENTS_LOG_BUILDER(observability::LogLevel::WARN, "Transactions reference unknown accounts")
        .field("count", unmatched.size())
        .field("first_sequence", unmatched.front().sequence_number);
  }

  report.text = renderReport(report.reconciled.accounts, report.groups);
  report.summary = buildSummary(report.reconciled, unmatched.size());
  return report;
}

std::string readFile(const std::string& path, const std::string& what) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    throw StatementError("Cannot open " + what, path);
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw StatementError("Cannot open " + what, path);
  }

  std::ostringstream content;
  content << in.rdbuf();
  if (in.bad()) {
    throw StatementError("Failed reading " + what, path);
  }
  return content.str();
}

std::string stageFile(const std::string& path, const std::string& content) {
  const std::string temp_path = path + ".tmp";

  std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw StatementError("Cannot create output file", temp_path);
  }
  out << content;
  out.flush();
  if (!out) {
    out.close();
    discardStagedFile(temp_path);
    throw StatementError("Failed writing output file", temp_path);
  }
  return temp_path;
}

void commitStagedFile(const std::string& temp_path, const std::string& path) {
  std::error_code ec;
  fs::rename(temp_path, path, ec);
  if (ec) {
    discardStagedFile(temp_path);
    throw StatementError("Cannot replace output file (" + ec.message() + ")", path);
  }
}

void discardStagedFile(const std::string& temp_path) {
  std::error_code ignored;
  fs::remove(temp_path, ignored);
}

StatementJob::StatementJob(const Config& config) : config_(config) {}

RunStats StatementJob::run() {
  auto& metrics = observability::getGlobalMetrics();
  observability::MetricsCollector::Timer timer(metrics, "statement_run_seconds");

  const std::string ledger_text = readFile(config_.ledger_path, "ledger file");
  const std::string transactions_text = readFile(config_.transactions_path, "transaction log");
  STATEMENTS_LOG_BUILDER(observability::LogLevel::INFO, "Input files loaded")
      .field("ledger", config_.ledger_path)
      .field("transactions", config_.transactions_path);

  Report report = buildReport(ledger_text, transactions_text);
  STATEMENTS_LOG_BUILDER(observability::LogLevel::INFO, "Accounts reconciled")
      .field("accounts", report.stats.accounts_loaded)
      .field("transactions", report.stats.transactions_parsed);

  const std::string statement_temp = stageFile(config_.output_path, report.text);
  std::string summary_temp;
  if (!config_.summary_path.empty()) {
    try {
      summary_temp = stageFile(config_.summary_path, serializeSummary(report.summary));
    } catch (const StatementError&) {
      discardStagedFile(statement_temp);
      throw;
    }
  }

  try {
    commitStagedFile(statement_temp, config_.output_path);
  } catch (const StatementError&) {
    if (!summary_temp.empty()) discardStagedFile(summary_temp);
    throw;
  }
  if (!summary_temp.empty()) {
    commitStagedFile(summary_temp, config_.summary_path);
  }
  report.stats.bytes_written = report.text.size();

  STATEMENTS_LOG_BUILDER(observability::LogLevel::INFO, "Statement written")
      .field("output", config_.output_path)
      .field("bytes", report.stats.bytes_written);

  recordMetrics(report.stats);
  return report.stats;
}

void StatementJob::recordMetrics(const RunStats& stats) const {
  auto& metrics = observability::getGlobalMetrics();
  metrics.describe("accounts_loaded_total", "Accounts loaded from the ledger");
  metrics.describe("ledger_lines_dropped_total", "Ledger lines not matching the ledger pattern");
  metrics.describe("transaction_lines_total", "Transaction log lines parsed");
  metrics.describe("transactions_unknown_type_total", "Transactions with an unrecognised type");
  metrics.describe("transactions_unparsed_account_total", "Transactions whose account number is not numeric");
  metrics.describe("transactions_malformed_amount_total", "Transactions whose amount defaulted to 0.00");
  metrics.describe("transactions_unmatched_total", "Transactions without a ledger account");
  metrics.describe("accounts_reconciled_total", "Accounts with a reconciled balance");
  metrics.describe("statement_bytes_written", "Size of the last statement file");
  metrics.describe("statement_run_seconds", "Wall time of a statement run");

  metrics.incrementCounter("accounts_loaded_total", static_cast<double>(stats.accounts_loaded));
  metrics.incrementCounter("ledger_lines_dropped_total", static_cast<double>(stats.ledger_lines_dropped));
  metrics.incrementCounter("transaction_lines_total", static_cast<double>(stats.transactions_parsed));
  metrics.incrementCounter("transactions_unknown_type_total",
                           static_cast<double>(stats.unknown_type_transactions));
  metrics.incrementCounter("transactions_unparsed_account_total",
                           static_cast<double>(stats.unparsed_account_transactions));
  metrics.incrementCounter("transactions_malformed_amount_total",
                           static_cast<double>(stats.malformed_amount_transactions));
  metrics.incrementCounter("transactions_unmatched_total",
                           static_cast<double>(stats.unmatched_transactions));
  metrics.incrementCounter("accounts_reconciled_total", static_cast<double>(stats.accounts_loaded));
  metrics.setGauge("statement_bytes_written", static_cast<double>(stats.bytes_written));
}

}  // namespace statements
