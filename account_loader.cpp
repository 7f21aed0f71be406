#include "account.hpp"
#include "amount.hpp"
#include "observability/logger.hpp"
#include "text_utils.hpp"

#include <charconv>
#include <regex>
#include <string>

namespace statements {

namespace {

// <number> "<name>" <digits>.<digits>
const std::regex& ledgerLinePattern() {
  static const std::regex pattern(R"re(^\s*([0-9]+)\s+"([^"]*)"\s+([0-9]+\.[0-9]+)\s*$)re");
  return pattern;
}

}  // namespace

bool parseAccountLine(std::string_view line, Account& out) {
  const std::string text(line);
  std::smatch match;
  if (!std::regex_match(text, match, ledgerLinePattern())) {
    return false;
  }

  const std::string number = match[1].str();
  int account_number = 0;
  auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), account_number);
  if (ec != std::errc() || ptr != number.data() + number.size()) {
    // Too many digits for an int.
    return false;
  }

  const double balance = parseAmount(match[3].str());
  out = Account{account_number, match[2].str(), balance, balance};
  return true;
}

LedgerLoadResult loadAccounts(std::string_view ledger_text) {
  LedgerLoadResult result;
  size_t line_number = 0;

  for (const std::string& line : splitLines(ledger_text)) {
    ++line_number;
    if (trimCopy(line).empty()) continue;

    Account account;
    if (!parseAccountLine(line, account)) {
      ++result.lines_dropped;
      STATEMENTS_LOG_BUILDER(observability::LogLevel::DEBUG, "Dropping unmatched ledger line")
          .field("line", line_number);
      continue;
    }
    result.accounts.insert_or_assign(account.account_number, std::move(account));
  }
  return result;
}

}  // namespace statements
