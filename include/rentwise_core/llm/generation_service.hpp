#pragma once

#include <string>

#include "rentwise_core/llm/rag_prompt.hpp"

namespace rentwise_core {

// External text generator. Implementations must bound every call with a
// timeout and raise GenerationError on failure.
class GenerationService {
 public:
  virtual ~GenerationService() = default;

  virtual std::string generate(const ChatPrompt &prompt) = 0;
};

}  // namespace rentwise_core
