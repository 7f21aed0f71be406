#ifndef STATEMENTS_TRANSACTION_GROUPER_HPP_
#define STATEMENTS_TRANSACTION_GROUPER_HPP_

#include "transaction.hpp"

#include <map>
#include <optional>
#include <vector>

namespace statements {

// Transactions per account number. Records whose account field was not a
// number are kept under the std::nullopt key, which matches no account.
using TransactionsByAccount = std::map<std::optional<int>, std::vector<Transaction>>;

/**
 * Partitions transactions by account number. Each group keeps the input
 * (file) order; every input transaction lands in exactly one group.
 */
TransactionsByAccount groupByAccount(const std::vector<Transaction>& transactions);

/**
 * Returns the group for `account_number`, or an empty list when the account
 * has no transactions.
 */
const std::vector<Transaction>& transactionsFor(const TransactionsByAccount& groups,
                                                 int account_number);

}  // namespace statements

#endif  // STATEMENTS_TRANSACTION_GROUPER_HPP_
