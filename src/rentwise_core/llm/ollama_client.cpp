#include "rentwise_core/llm/ollama_client.hpp"

#include "ollama.hpp"

namespace rentwise_core {

OllamaClient::OllamaClient(const std::string &ollama_url,
                           const std::string &embedding_model,
                           int timeout_seconds)
    : ollama_url_(ollama_url), embedding_model_(embedding_model), timeout_seconds_(timeout_seconds) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  ollama::setReadTimeout(timeout_seconds_);
  ollama::setWriteTimeout(timeout_seconds_);
  if (!ollama::is_running()) {
    throw ModelUnavailableError("Ollama server is not running at " + ollama_url_);
  }
}

// The Ollama api supports batch requests for the embeddings, this will have to be a separate endpoint
std::vector<std::vector<float>> OllamaClient::embed(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());
  for (const auto &text : texts) {
    vectors.push_back(get_embedding(text));
  }
  return vectors;
}

// Same model and no query prefix, so query vectors live in the index's space
std::vector<float> OllamaClient::embed_query(const std::string &text) {
  return get_embedding(text);
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);

    auto json_response = response.as_json();
    if (!json_response.contains("embeddings")) {
      throw ModelUnavailableError("Response from " + embedding_model_ +
                                  " does not contain embedding field");
    }

    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array() || embeddings.empty()) {
      throw ModelUnavailableError("Embeddings field is not a non-empty array");
    }
    // Array of arrays - take the first embedding vector
    if (embeddings[0].is_array()) {
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();

  } catch (const ollama::exception &e) {
    throw ModelUnavailableError("Embedding generation failed: " + std::string(e.what()));
  }
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace rentwise_core
