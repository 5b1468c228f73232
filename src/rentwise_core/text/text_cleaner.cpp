#include "rentwise_core/text/text_cleaner.hpp"

#include <regex>
#include <sstream>

namespace rentwise_core {

namespace {

constexpr const char *WHITESPACE = " \t\n\r\f\v";

}  // namespace

std::string trim_whitespace(const std::string &text) {
  const auto first = text.find_first_not_of(WHITESPACE);
  if (first == std::string::npos) {
    return "";
  }
  const auto last = text.find_last_not_of(WHITESPACE);
  return text.substr(first, last - first + 1);
}

std::string clean_text(const std::string &text) {
  if (text.empty()) {
    return "";
  }

  static const std::regex crlf("\r\n");
  static const std::regex cr("\r");
  static const std::regex horizontal_space("[ \t]+");
  static const std::regex excess_newlines("\n{3,}");

  std::string result = std::regex_replace(text, crlf, "\n");
  result = std::regex_replace(result, cr, "\n");
  result = std::regex_replace(result, horizontal_space, " ");
  result = std::regex_replace(result, excess_newlines, "\n\n");

  std::string joined;
  std::istringstream lines(result);
  std::string line;
  bool first = true;
  while (std::getline(lines, line)) {
    if (!first) {
      joined += '\n';
    }
    joined += trim_whitespace(line);
    first = false;
  }
  return trim_whitespace(joined);
}

}  // namespace rentwise_core
