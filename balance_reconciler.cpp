#include "balance_reconciler.hpp"

#include <algorithm>

namespace statements {

double foldBalance(double starting_balance, const std::vector<Transaction>& transactions) {
  double balance = starting_balance;
  for (const Transaction& tx : transactions) {
    switch (tx.type) {
      case TransactionType::PAYMENT:
        balance += tx.amount;
        break;
      case TransactionType::PURCHASE:
        balance -= tx.amount;
        break;
      default:
        break;
    }
  }
  return balance;
}

Reconciliation reconcileAccount(const Account& account, const TransactionsByAccount& groups) {
  const std::vector<Transaction>& transactions = transactionsFor(groups, account.account_number);

  Reconciliation result;
  result.account = account;
  result.account.balance = foldBalance(account.starting_balance, transactions);

  for (const Transaction& tx : transactions) {
    if (tx.type == TransactionType::PAYMENT) {
      result.totals.total_payments += tx.amount;
    } else if (tx.type == TransactionType::PURCHASE) {
      result.totals.total_purchases += tx.amount;
    }
  }
  result.totals.transaction_count = transactions.size();
  return result;
}

RegistryReconciliation reconcileAll(const AccountRegistry& accounts,
                                    const TransactionsByAccount& groups) {
  RegistryReconciliation result;
  for (const auto& [number, account] : accounts) {
    Reconciliation r = reconcileAccount(account, groups);
    result.accounts.emplace(number, std::move(r.account));
    result.totals.emplace(number, r.totals);
  }
  return result;
}

std::vector<Transaction> unmatchedTransactions(const AccountRegistry& accounts,
                                               const TransactionsByAccount& groups) {
  std::vector<Transaction> unmatched;
  for (const auto& [key, transactions] : groups) {
    if (key && accounts.count(*key) > 0) continue;
    unmatched.insert(unmatched.end(), transactions.begin(), transactions.end());
  }
  std::sort(unmatched.begin(), unmatched.end(), [](const Transaction& a, const Transaction& b) {
    return a.sequence_number < b.sequence_number;
  });
  return unmatched;
}

}  // namespace statements
