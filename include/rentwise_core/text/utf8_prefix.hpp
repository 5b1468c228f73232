#pragma once

#include <string>

namespace rentwise_core {

// Returns the first max_chars code points of text without splitting a
// multi-byte sequence. Invalid UTF-8 is cut at the byte level instead.
std::string utf8_prefix(const std::string &text, size_t max_chars);

// Number of code points in text (bytes, if text is not valid UTF-8)
size_t utf8_length(const std::string &text);

}  // namespace rentwise_core
