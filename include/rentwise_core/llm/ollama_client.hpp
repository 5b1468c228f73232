#pragma once

#include <string>
#include <vector>

#include "rentwise_core/errors.hpp"
#include "rentwise_core/llm/embedding_provider.hpp"

namespace rentwise_core {

class OllamaClient : public EmbeddingProvider {
 public:
  // Throws ModelUnavailableError if the server cannot be reached
  OllamaClient(const std::string &ollama_url,
               const std::string &embedding_model,
               int timeout_seconds = 60);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) override;
  std::vector<float> embed_query(const std::string &text) override;

  const std::string &model_id() const override {
    return embedding_model_;
  }

  bool is_server_available();

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  int timeout_seconds_;

  void setup_server_connection();
  std::vector<float> get_embedding(const std::string &text);
};

}  // namespace rentwise_core
