#pragma once

#include <string>
#include <vector>

#include "rentwise_core/types/chunk.hpp"

namespace rentwise_core {

struct ChatPrompt {
  std::string system;
  std::string user;
};

// Chunk contents in rank order, separated by a blank line
std::string format_context(const std::vector<RerankedChunk> &chunks);

// System instructions carry the context and the question; the user turn
// repeats the question.
ChatPrompt build_rag_prompt(const std::string &context, const std::string &question);

}  // namespace rentwise_core
