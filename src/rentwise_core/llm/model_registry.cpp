#include "rentwise_core/llm/model_registry.hpp"

#include <chrono>
#include <iostream>

#include "rentwise_core/errors.hpp"

namespace rentwise_core {

ModelRegistry::ModelRegistry(EmbeddingFactory embedding_factory,
                             CrossEncoderFactory cross_encoder_factory)
    : embedding_factory_(std::move(embedding_factory)),
      cross_encoder_factory_(std::move(cross_encoder_factory)) {}

std::shared_ptr<EmbeddingProvider> ModelRegistry::embedding_provider(const std::string &model_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = embedding_providers_.find(model_id);
  if (it != embedding_providers_.end()) {
    return it->second;
  }
  if (!embedding_factory_) {
    throw ModelUnavailableError("No embedding factory registered for model " + model_id);
  }

  auto start = std::chrono::steady_clock::now();
  std::shared_ptr<EmbeddingProvider> provider = embedding_factory_(model_id);
  if (!provider) {
    throw ModelUnavailableError("Embedding factory returned no provider for model " + model_id);
  }
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  std::cout << "Loaded embedding model " << model_id << " in " << elapsed.count() << "ms"
            << std::endl;

  embedding_providers_.emplace(model_id, provider);
  return provider;
}

std::shared_ptr<CrossEncoder> ModelRegistry::cross_encoder(const std::string &model_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = cross_encoders_.find(model_id);
  if (it != cross_encoders_.end()) {
    return it->second;
  }
  if (!cross_encoder_factory_) {
    throw ModelUnavailableError("No cross-encoder factory registered for model " + model_id);
  }

  auto start = std::chrono::steady_clock::now();
  std::shared_ptr<CrossEncoder> encoder = cross_encoder_factory_(model_id);
  if (!encoder) {
    throw ModelUnavailableError("Cross-encoder factory returned no model for " + model_id);
  }
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  std::cout << "Loaded cross-encoder " << model_id << " in " << elapsed.count() << "ms"
            << std::endl;

  cross_encoders_.emplace(model_id, encoder);
  return encoder;
}

bool ModelRegistry::has_embedding_provider(const std::string &model_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return embedding_providers_.count(model_id) > 0;
}

bool ModelRegistry::has_cross_encoder(const std::string &model_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cross_encoders_.count(model_id) > 0;
}

}  // namespace rentwise_core
