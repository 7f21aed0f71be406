#include "summary_export.hpp"
#include "amount.hpp"

namespace statements {

nlohmann::json buildSummary(const RegistryReconciliation& reconciled, size_t unmatched_transactions) {
  nlohmann::json accounts = nlohmann::json::array();

  for (const auto& [number, account] : reconciled.accounts) {
    ReconciliationTotals totals;
    auto it = reconciled.totals.find(number);
    if (it != reconciled.totals.end()) totals = it->second;

    nlohmann::json entry;
    entry["account_number"] = number;
    entry["customer"] = account.customer_info;
    entry["starting_balance"] = formatAmount(account.starting_balance);
    entry["final_balance"] = formatAmount(account.balance);
    entry["total_purchases"] = formatAmount(totals.total_purchases);
    entry["total_payments"] = formatAmount(totals.total_payments);
    entry["transaction_count"] = totals.transaction_count;
    accounts.push_back(std::move(entry));
  }

  nlohmann::json summary;
  summary["accounts"] = std::move(accounts);
  summary["unmatched_transactions"] = unmatched_transactions;
  return summary;
}

std::string serializeSummary(const nlohmann::json& summary) {
  return summary.dump(2) + "\n";
}

}  // namespace statements
