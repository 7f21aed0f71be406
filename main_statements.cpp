#include "include/statement_job.hpp"
#include "include/observability/logger.hpp"
#include "include/observability/metrics.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
  statements::StatementJob::Config config;

  // Parse command line arguments
  if (argc >= 2) config.ledger_path = argv[1];
  if (argc >= 3) config.transactions_path = argv[2];
  if (argc >= 4) config.output_path = argv[3];
  if (argc >= 5) config.summary_path = argv[4];

  auto& logger = statements::observability::Logger::getInstance();
  if (argc >= 6) {
    if (auto level = statements::observability::parseLogLevel(argv[5])) {
      config.log_level = *level;
    } else {
      STATEMENTS_LOG_BUILDER(statements::observability::LogLevel::WARN, "Unknown log level, using info")
          .field("value", argv[5]);
    }
  }
  logger.setLogLevel(config.log_level);

  try {
    statements::StatementJob job(config);
    const statements::RunStats stats = job.run();

    std::cout << "Statements written to " << config.output_path
              << " (" << stats.accounts_loaded << " accounts, "
              << stats.transactions_parsed << " transactions)" << std::endl;
    STATEMENTS_LOG_DEBUG(statements::observability::getGlobalMetrics().exportMetrics());
  } catch (const std::exception& e) {
    STATEMENTS_LOG_ERROR(e.what());
    return 1;
  }

  return 0;
}
