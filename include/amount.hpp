#ifndef STATEMENTS_AMOUNT_HPP_
#define STATEMENTS_AMOUNT_HPP_

#include <string>
#include <string_view>

namespace statements {

/**
 * Parses a money token such as "12", "-12.5" or " 40.00 ".
 * Surrounding whitespace is ignored. Anything that is not an optional minus
 * sign, one or more digits and an optional fraction yields 0.0.
 */
double parseAmount(std::string_view token);

// True when parseAmount would read `token` as a number rather than default it.
bool isAmountToken(std::string_view token);

/**
 * Renders an amount using its shortest round-trip decimal form, then widens a
 * lone ".0" suffix to ".00" (115 -> "115.00", 25.25 -> "25.25").
 * Other one-digit fractions are left as they are (3.1 -> "3.1").
 */
std::string formatAmount(double amount);

}  // namespace statements

#endif  // STATEMENTS_AMOUNT_HPP_
