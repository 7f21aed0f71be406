#ifndef STATEMENTS_BALANCE_RECONCILER_HPP_
#define STATEMENTS_BALANCE_RECONCILER_HPP_

#include "account.hpp"
#include "transaction_grouper.hpp"

#include <map>
#include <vector>

namespace statements {

/**
 * Category subtotals of one account's transaction list.
 */
struct ReconciliationTotals {
  double total_purchases{0.0};
  double total_payments{0.0};
  size_t transaction_count{0};
};

/**
 * A reconciled copy of an account together with the subtotals that went
 * into its balance.
 */
struct Reconciliation {
  Account account;
  ReconciliationTotals totals;
};

struct RegistryReconciliation {
  AccountRegistry accounts;
  std::map<int, ReconciliationTotals> totals;
};

/**
 * Folds `transactions` over `starting_balance` in order: payments add,
 * purchases subtract, any other type leaves the balance alone.
 */
double foldBalance(double starting_balance, const std::vector<Transaction>& transactions);

/**
 * Reconciles one account against its group in `groups`. The result carries
 * the same starting balance and a balance recomputed from it; neither input
 * is modified.
 */
Reconciliation reconcileAccount(const Account& account, const TransactionsByAccount& groups);

// Reconciles every account of the registry.
RegistryReconciliation reconcileAll(const AccountRegistry& accounts,
                                    const TransactionsByAccount& groups);

/**
 * Transactions whose account number matches no account of the registry,
 * in file order.
 */
std::vector<Transaction> unmatchedTransactions(const AccountRegistry& accounts,
                                               const TransactionsByAccount& groups);

}  // namespace statements

#endif  // STATEMENTS_BALANCE_RECONCILER_HPP_
