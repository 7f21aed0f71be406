#include "amount.hpp"
#include "observability/logger.hpp"
#include "text_utils.hpp"
#include "transaction.hpp"

#include <algorithm>
#include <charconv>

namespace statements {

namespace {

std::string fieldOrEmpty(const std::vector<std::string>& fields, size_t index) {
  return index < fields.size() ? fields[index] : std::string();
}

std::optional<int> parseAccountNumber(std::string_view field) {
  const std::string trimmed = trimCopy(field);
  if (trimmed.empty()) return std::nullopt;

  int value = 0;
  const char* last = trimmed.data() + trimmed.size();
  auto [ptr, ec] = std::from_chars(trimmed.data(), last, value);
  if (ec != std::errc() || ptr != last) return std::nullopt;
  return value;
}

std::string stripQuotes(std::string s) {
  s.erase(std::remove(s.begin(), s.end(), '"'), s.end());
  return s;
}

// Payment records carry six fields, purchases five.
std::string selectAmountField(const std::vector<std::string>& fields) {
  if (fields.size() >= 6) return fields[5];
  if (fields.size() >= 5) return fields[4];
  return std::string();
}

}  // namespace

TransactionType transactionTypeFromTag(std::string_view tag) {
  if (tag == "payment") return TransactionType::PAYMENT;
  if (tag == "purchase") return TransactionType::PURCHASE;
  return TransactionType::UNKNOWN;
}

std::string toString(TransactionType type) {
  switch (type) {
    case TransactionType::PAYMENT: return "payment";
    case TransactionType::PURCHASE: return "purchase";
    case TransactionType::UNKNOWN: return "unknown";
    default: return "unknown";
  }
}

std::string toString(PaymentMethod method) {
  switch (method) {
    case PaymentMethod::CASH: return "Cash";
    case PaymentMethod::CREDIT: return "Credit";
    case PaymentMethod::CHECK: return "Check";
    case PaymentMethod::UNKNOWN: return "Unknown";
    case PaymentMethod::PURCHASE: return "Purchase";
    default: return "Unknown";
  }
}

std::vector<std::string> splitTabs(std::string_view line) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= line.size()) {
    size_t pos = line.find('\t', start);
    if (pos == std::string_view::npos) {
      out.emplace_back(line.substr(start));
      break;
    }
    out.emplace_back(line.substr(start, pos - start));
    start = pos + 1;
  }
  return out;
}

PaymentDetails parsePaymentMethod(const std::vector<std::string>& fields) {
  const std::string method = toLowerCopy(trimCopy(fieldOrEmpty(fields, 3)));

  if (method == "cash") {
    return {PaymentMethod::CASH, "", ""};
  }
  if (method == "credit" || method == "check") {
    const PaymentMethod tag = method == "credit" ? PaymentMethod::CREDIT : PaymentMethod::CHECK;
    std::string reference = fieldOrEmpty(fields, 4);
    std::string amount_text = fields.size() > 5 ? fields[5] : std::string("0");
    return {tag, std::move(reference), std::move(amount_text)};
  }
  return {PaymentMethod::UNKNOWN, "", "0"};
}

Transaction parseTransaction(std::string_view line, size_t sequence_number) {
  const std::vector<std::string> fields = splitTabs(line);

  Transaction tx;
  tx.sequence_number = sequence_number;
  tx.type_tag = toLowerCopy(trimCopy(fieldOrEmpty(fields, 0)));
  tx.type = transactionTypeFromTag(tx.type_tag);
  tx.account_field = fieldOrEmpty(fields, 1);
  tx.account_number = parseAccountNumber(tx.account_field);
  tx.timestamp = fieldOrEmpty(fields, 2);
  tx.merchant = stripQuotes(fieldOrEmpty(fields, 3));

  PaymentDetails details;
  if (tx.type == TransactionType::PAYMENT) {
    details = parsePaymentMethod(fields);
  }
  tx.payment_method = details.method;
  tx.card_or_check_number = details.reference;

  tx.amount_text = selectAmountField(fields);
  tx.amount = parseAmount(tx.amount_text);
  return tx;
}

TransactionLogParseResult parseTransactions(std::string_view log_text) {
  TransactionLogParseResult result;
  const std::vector<std::string> lines = splitLines(log_text);

  for (size_t i = 0; i < lines.size(); ++i) {
    if (trimCopy(lines[i]).empty()) continue;

    Transaction tx = parseTransaction(lines[i], i);
    if (tx.type == TransactionType::UNKNOWN) {
      ++result.unknown_type_count;
      STATEMENTS_LOG_BUILDER(observability::LogLevel::DEBUG, "Unrecognised transaction type")
          .field("sequence", i)
          .field("type", tx.type_tag);
    }
    if (!tx.account_number) {
      ++result.unparsed_account_count;
      STATEMENTS_LOG_BUILDER(observability::LogLevel::DEBUG, "Transaction account number is not numeric")
          .field("sequence", i)
          .field("account", tx.account_field);
    }
    if (!trimCopy(tx.amount_text).empty() && !isAmountToken(tx.amount_text)) {
      ++result.malformed_amount_count;
      STATEMENTS_LOG_BUILDER(observability::LogLevel::DEBUG, "Transaction amount is not a number, using 0.00")
          .field("sequence", i)
          .field("amount", tx.amount_text);
    }
    result.transactions.push_back(std::move(tx));
  }
  return result;
}

}  // namespace statements
