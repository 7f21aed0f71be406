#ifndef STATEMENTS_TEXT_UTILS_HPP_
#define STATEMENTS_TEXT_UTILS_HPP_

#include <string>
#include <string_view>
#include <vector>

namespace statements {

std::string trimCopy(std::string_view sv);
std::string toLowerCopy(std::string_view sv);

/**
 * Splits text into lines on '\n', dropping a trailing '\r' from each line.
 * A final newline does not produce an extra empty line.
 */
std::vector<std::string> splitLines(std::string_view text);

}  // namespace statements

#endif  // STATEMENTS_TEXT_UTILS_HPP_
