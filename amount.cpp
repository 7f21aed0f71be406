#include "amount.hpp"
#include "text_utils.hpp"

#include <charconv>
#include <regex>
#include <string>

namespace statements {

namespace {

const std::regex& amountPattern() {
  static const std::regex pattern(R"(-?[0-9]+(\.[0-9]+)?)");
  return pattern;
}

}  // namespace

bool isAmountToken(std::string_view token) {
  return std::regex_match(trimCopy(token), amountPattern());
}

double parseAmount(std::string_view token) {
  const std::string trimmed = trimCopy(token);
  if (!std::regex_match(trimmed, amountPattern())) {
    return 0.0;
  }

  double value = 0.0;
  const char* first = trimmed.data();
  const char* last = trimmed.data() + trimmed.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    // Out of range for a double.
    return 0.0;
  }
  return value;
}

std::string formatAmount(double amount) {
  // Large enough for any finite double in fixed notation.
  char buf[400];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), amount, std::chars_format::fixed);
  std::string text = ec == std::errc() ? std::string(buf, ptr) : std::to_string(amount);

  if (text.find('.') == std::string::npos &&
      text.find_first_not_of("-0123456789") == std::string::npos) {
    text += ".0";
  }
  if (text.size() >= 2 && text.compare(text.size() - 2, 2, ".0") == 0) {
    text += "0";
  }
  return text;
}

}  // namespace statements
