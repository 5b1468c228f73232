#include "rentwise_core/text/utf8_prefix.hpp"

#include <utf8.h>

namespace rentwise_core {

std::string utf8_prefix(const std::string &text, size_t max_chars) {
  if (!utf8::is_valid(text.begin(), text.end())) {
    return text.substr(0, max_chars);
  }

  auto it = text.begin();
  size_t count = 0;
  while (it != text.end() && count < max_chars) {
    utf8::next(it, text.end());
    ++count;
  }
  return std::string(text.begin(), it);
}

size_t utf8_length(const std::string &text) {
  if (!utf8::is_valid(text.begin(), text.end())) {
    return text.size();
  }
  return static_cast<size_t>(utf8::distance(text.begin(), text.end()));
}

}  // namespace rentwise_core
