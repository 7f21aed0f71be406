#include "text_utils.hpp"

#include <algorithm>
#include <cctype>

namespace statements {

std::string trimCopy(std::string_view sv) {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  size_t b = 0, e = sv.size();
  while (b < e && is_space(static_cast<unsigned char>(sv[b]))) ++b;
  while (e > b && is_space(static_cast<unsigned char>(sv[e - 1]))) --e;
  return std::string(sv.substr(b, e - b));
}

std::string toLowerCopy(std::string_view sv) {
  std::string r(sv);
  std::transform(r.begin(), r.end(), r.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return r;
}

std::vector<std::string> splitLines(std::string_view text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start < text.size()) {
    size_t pos = text.find('\n', start);
    if (pos == std::string_view::npos) pos = text.size();
    std::string_view line = text.substr(start, pos - start);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    lines.emplace_back(line);
    start = pos + 1;
  }
  return lines;
}

}  // namespace statements
