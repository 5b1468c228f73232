#pragma once

#include <string>

#include "rentwise_core/llm/generation_service.hpp"

namespace rentwise_core {

struct OpenAiChatOptions {
  std::string api_key;
  std::string base_url = "https://api.deepseek.com/v1";
  std::string model = "deepseek-chat";
  double temperature = 0.3;
  int max_tokens = 2000;
  int timeout_seconds = 60;
};

// GenerationService over an OpenAI-compatible /chat/completions endpoint.
// Each call uses its own curl handle, so one client may be shared between
// threads. curl_global_init must have run before the first call.
class OpenAiChatClient : public GenerationService {
 public:
  // Throws std::invalid_argument for an empty API key, base URL or model
  explicit OpenAiChatClient(OpenAiChatOptions options);

  std::string generate(const ChatPrompt &prompt) override;

  const OpenAiChatOptions &options() const {
    return options_;
  }

 private:
  std::string completions_url() const;

  OpenAiChatOptions options_;
};

}  // namespace rentwise_core
