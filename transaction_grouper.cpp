#include "transaction_grouper.hpp"

namespace statements {

TransactionsByAccount groupByAccount(const std::vector<Transaction>& transactions) {
  TransactionsByAccount groups;
  for (const Transaction& tx : transactions) {
    groups[tx.account_number].push_back(tx);
  }
  return groups;
}

const std::vector<Transaction>& transactionsFor(const TransactionsByAccount& groups,
                                                 int account_number) {
  static const std::vector<Transaction> kNone;
  auto it = groups.find(account_number);
  return it != groups.end() ? it->second : kNone;
}

}  // namespace statements
