#ifndef STATEMENTS_TRANSACTION_HPP_
#define STATEMENTS_TRANSACTION_HPP_

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace statements {

// Tag taken from the first field of a log line.
enum class TransactionType {
  PAYMENT,
  PURCHASE,
  UNKNOWN
};

// PURCHASE is the implicit method for anything that is not a payment.
enum class PaymentMethod {
  CASH,
  CREDIT,
  CHECK,
  UNKNOWN,
  PURCHASE
};

/**
 * Output of the payment-method sub-parser.
 * amount_text is the amount column as the sub-parser sees it; the stored
 * Transaction::amount comes from the record parser's own field selection.
 */
struct PaymentDetails {
  PaymentMethod method{PaymentMethod::PURCHASE};
  std::string reference;  // card or check number
  std::string amount_text;
};

/**
 * One parsed line of the transaction log. Immutable once built.
 */
struct Transaction {
  TransactionType type{TransactionType::UNKNOWN};
  std::string type_tag;  // lower-cased first field, e.g. "refund"
  size_t sequence_number{0};
  std::optional<int> account_number;  // nullopt when field 1 is not a number
  std::string account_field;  // raw field 1, kept for diagnostics
  std::string timestamp;
  std::string merchant;
  PaymentMethod payment_method{PaymentMethod::PURCHASE};
  std::string card_or_check_number;
  std::string amount_text;  // raw amount column, empty on short lines
  double amount{0.0};
};

struct TransactionLogParseResult {
  std::vector<Transaction> transactions;
  size_t unknown_type_count{0};
  size_t unparsed_account_count{0};
  size_t malformed_amount_count{0};
};

TransactionType transactionTypeFromTag(std::string_view tag);
std::string toString(TransactionType type);
std::string toString(PaymentMethod method);

// Splits on '\t', keeping empty fields.
std::vector<std::string> splitTabs(std::string_view line);

/**
 * Interprets the payment columns of a payment record.
 * Field 3 names the method; credit and check read their reference from
 * field 4 and their amount from field 5 ("0" when absent).
 */
PaymentDetails parsePaymentMethod(const std::vector<std::string>& fields);

/**
 * Parses one tab-delimited log line. Never throws: malformed amounts become
 * 0.0, a malformed account number becomes nullopt, unknown tags map to the
 * UNKNOWN enumerators.
 */
Transaction parseTransaction(std::string_view line, size_t sequence_number);

/**
 * Parses the whole log. Blank lines are skipped but still advance the
 * sequence number, so sequence_number is always the zero-based line index.
 */
TransactionLogParseResult parseTransactions(std::string_view log_text);

}  // namespace statements

#endif  // STATEMENTS_TRANSACTION_HPP_
