#include "statement_renderer.hpp"
#include "amount.hpp"

#include <algorithm>
#include <sstream>

namespace statements {

namespace {

const char* const kSeparator = "----------------------------------------";

std::string transactionLine(const Transaction& tx) {
  std::vector<std::string> columns;
  if (!tx.timestamp.empty()) columns.push_back(tx.timestamp);
  if (tx.type == TransactionType::PURCHASE && !tx.merchant.empty()) {
    columns.push_back(tx.merchant);
  }
  columns.push_back(toString(tx.payment_method));
  if (!tx.card_or_check_number.empty()) columns.push_back(tx.card_or_check_number);
  columns.push_back(formatAmount(tx.amount));

  std::string line;
  for (const std::string& column : columns) {
    line += "  ";
    line += column;
  }
  return line;
}

}  // namespace

StatementTotals renderStatement(std::ostream& out, const Account& account,
                                const std::vector<Transaction>& transactions) {
  std::vector<const Transaction*> ordered;
  ordered.reserve(transactions.size());
  for (const Transaction& tx : transactions) ordered.push_back(&tx);
  std::stable_sort(ordered.begin(), ordered.end(), [](const Transaction* a, const Transaction* b) {
    return a->sequence_number < b->sequence_number;
  });

  StatementTotals totals;
  out << "Account " << account.account_number << " - " << account.customer_info
      << " - Starting balance: " << formatAmount(account.starting_balance) << "\n";

  for (const Transaction* tx : ordered) {
    out << transactionLine(*tx) << "\n";
    if (tx->type == TransactionType::PURCHASE) {
      totals.total_purchases += tx->amount;
    } else if (tx->type == TransactionType::PAYMENT) {
      totals.total_payments += tx->amount;
    }
  }
  totals.final_balance = account.starting_balance + totals.total_payments - totals.total_purchases;

  out << "Total purchases: " << formatAmount(totals.total_purchases) << "\n";
  out << "Total payments: " << formatAmount(totals.total_payments) << "\n";
  out << "Final balance: " << formatAmount(totals.final_balance) << "\n";
  out << kSeparator << "\n";
  return totals;
}

std::string renderReport(const AccountRegistry& accounts, const TransactionsByAccount& groups) {
  std::ostringstream out;
  for (const auto& [number, account] : accounts) {
    renderStatement(out, account, transactionsFor(groups, number));
  }
  return out.str();
}

}  // namespace statements
