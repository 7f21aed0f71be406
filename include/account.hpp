#ifndef STATEMENTS_ACCOUNT_HPP_
#define STATEMENTS_ACCOUNT_HPP_

#include <map>
#include <string>
#include <string_view>

namespace statements {

/**
 * One customer account from the ledger.
 * starting_balance is fixed at load time; balance is recomputed by the
 * reconciler, which returns a new Account instead of updating this one.
 */
struct Account {
  int account_number{0};
  std::string customer_info;
  double starting_balance{0.0};
  double balance{0.0};
};

// Accounts keyed (and therefore rendered) by account number.
using AccountRegistry = std::map<int, Account>;

/**
 * Result of loading a ledger: the registry plus the number of non-blank
 * lines that did not match the ledger pattern.
 */
struct LedgerLoadResult {
  AccountRegistry accounts;
  size_t lines_dropped{0};
};

/**
 * Parses a single ledger line of the form
 *   <account number> "<customer name>" <digits>.<digits>
 * Returns false (and leaves `out` untouched) when the line does not match.
 */
bool parseAccountLine(std::string_view line, Account& out);

/**
 * Builds the account registry from the full ledger text. Non-matching lines
 * are dropped; a repeated account number keeps the last matching line.
 */
LedgerLoadResult loadAccounts(std::string_view ledger_text);

}  // namespace statements

#endif  // STATEMENTS_ACCOUNT_HPP_
