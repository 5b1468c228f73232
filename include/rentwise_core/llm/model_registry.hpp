#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "rentwise_core/llm/embedding_provider.hpp"
#include "rentwise_core/ranking/cross_encoder.hpp"

namespace rentwise_core {

// Process-wide home for the expensive models. Each model id is constructed at
// most once, on first request, through the injected factory; later requests
// for the same id share the cached instance. Factories may throw
// ModelUnavailableError, in which case nothing is cached and the next request
// retries the construction.
class ModelRegistry {
 public:
  using EmbeddingFactory =
      std::function<std::shared_ptr<EmbeddingProvider>(const std::string &model_id)>;
  using CrossEncoderFactory =
      std::function<std::shared_ptr<CrossEncoder>(const std::string &model_id)>;

  ModelRegistry(EmbeddingFactory embedding_factory, CrossEncoderFactory cross_encoder_factory);

  ModelRegistry(const ModelRegistry &) = delete;
  ModelRegistry &operator=(const ModelRegistry &) = delete;
  ModelRegistry(ModelRegistry &&) = delete;
  ModelRegistry &operator=(ModelRegistry &&) = delete;

  std::shared_ptr<EmbeddingProvider> embedding_provider(const std::string &model_id);
  std::shared_ptr<CrossEncoder> cross_encoder(const std::string &model_id);

  bool has_embedding_provider(const std::string &model_id) const;
  bool has_cross_encoder(const std::string &model_id) const;

 private:
  EmbeddingFactory embedding_factory_;
  CrossEncoderFactory cross_encoder_factory_;

  // Held across construction, so concurrent first requests load a model once
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<EmbeddingProvider>> embedding_providers_;
  std::unordered_map<std::string, std::shared_ptr<CrossEncoder>> cross_encoders_;
};

}  // namespace rentwise_core
