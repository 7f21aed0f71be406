#ifndef STATEMENTS_STATEMENT_JOB_HPP_
#define STATEMENTS_STATEMENT_JOB_HPP_

#include "balance_reconciler.hpp"
#include "observability/logger.hpp"
#include "transaction_grouper.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace statements {

/**
 * Fatal, file-level failure of a statement run (missing input, unwritable
 * output). Record-level problems never raise this.
 */
class StatementError : public std::runtime_error {
 public:
  StatementError(const std::string& message, const std::string& path)
      : std::runtime_error(message + ": " + path), path_(path) {}

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

struct RunStats {
  size_t accounts_loaded{0};
  size_t ledger_lines_dropped{0};
  size_t transactions_parsed{0};
  size_t unknown_type_transactions{0};
  size_t unparsed_account_transactions{0};
  size_t malformed_amount_transactions{0};
  size_t unmatched_transactions{0};
  size_t bytes_written{0};
};

/**
 * In-memory result of one run, before anything touches the file system.
 */
struct Report {
  RegistryReconciliation reconciled;
  TransactionsByAccount groups;
  std::string text;
  nlohmann::json summary;
  RunStats stats;
};

/**
 * Loads, groups, reconciles and renders. Never throws for malformed input.
 */
Report buildReport(std::string_view ledger_text, std::string_view transactions_text);

// Reads a whole file; throws StatementError when it cannot be opened or read.
std::string readFile(const std::string& path, const std::string& what);

/**
 * Writes `content` to `<path>.tmp` and returns that temporary path. The
 * destination itself is not touched. Throws StatementError (after removing
 * the temporary) when the file cannot be created or flushed.
 */
std::string stageFile(const std::string& path, const std::string& content);

// Renames a staged temporary over `path`. Throws StatementError on failure.
void commitStagedFile(const std::string& temp_path, const std::string& path);

// Removes a staged temporary; missing files are ignored.
void discardStagedFile(const std::string& temp_path);

/**
 * Batch job turning a ledger and a transaction log into a statement file.
 */
class StatementJob {
 public:
  struct Config {
    std::string ledger_path = "accounts.txt";
    std::string transactions_path = "transactions.txt";
    std::string output_path = "statements.txt";
    std::string summary_path = "";  // empty disables the JSON summary
    observability::LogLevel log_level = observability::LogLevel::INFO;
  };

  explicit StatementJob(const Config& config);

  /**
   * Runs the whole pipeline once. The statement and the optional summary
   * are both staged before either is renamed into place, so a read failure
   * or a failure to write either file throws StatementError and leaves
   * every existing output untouched.
   */
  RunStats run();

  const Config& config() const { return config_; }

 private:
  void recordMetrics(const RunStats& stats) const;

  Config config_;
};

}  // namespace statements

#endif  // STATEMENTS_STATEMENT_JOB_HPP_
