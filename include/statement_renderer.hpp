#ifndef STATEMENTS_STATEMENT_RENDERER_HPP_
#define STATEMENTS_STATEMENT_RENDERER_HPP_

#include "account.hpp"
#include "transaction.hpp"
#include "transaction_grouper.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace statements {

/**
 * Totals the renderer computes on its own from the transactions it prints.
 * final_balance = starting balance + total_payments - total_purchases.
 */
struct StatementTotals {
  double total_purchases{0.0};
  double total_payments{0.0};
  double final_balance{0.0};
};

/**
 * Writes one statement block for `account`, listing `transactions` in
 * sequence order, and returns the totals it printed.
 */
StatementTotals renderStatement(std::ostream& out, const Account& account,
                                const std::vector<Transaction>& transactions);

/**
 * Renders every account of the registry, ascending by account number.
 */
std::string renderReport(const AccountRegistry& accounts, const TransactionsByAccount& groups);

}  // namespace statements

#endif  // STATEMENTS_STATEMENT_RENDERER_HPP_
