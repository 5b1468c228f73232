#pragma once

#include <string>

namespace rentwise_core {

// Normalizes page text: CRLF and CR become LF, runs of spaces/tabs become
// one space, three or more newlines become a blank line, every line is
// trimmed and so is the result.
std::string clean_text(const std::string &text);

// Trims ASCII whitespace from both ends
std::string trim_whitespace(const std::string &text);

}  // namespace rentwise_core
