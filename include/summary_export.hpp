#ifndef STATEMENTS_SUMMARY_EXPORT_HPP_
#define STATEMENTS_SUMMARY_EXPORT_HPP_

#include "balance_reconciler.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace statements {

/**
 * Machine-readable companion of the text statement. Amounts are rendered
 * with formatAmount so both outputs show identical figures.
 */
nlohmann::json buildSummary(const RegistryReconciliation& reconciled, size_t unmatched_transactions);

std::string serializeSummary(const nlohmann::json& summary);

}  // namespace statements

#endif  // STATEMENTS_SUMMARY_EXPORT_HPP_
