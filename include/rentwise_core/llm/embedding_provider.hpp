#pragma once

#include <string>
#include <vector>

namespace rentwise_core {

class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  // Document-side embeddings, one fixed-length vector per input text
  virtual std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) = 0;

  // Query-side embedding. Must match whatever produced the persisted index.
  virtual std::vector<float> embed_query(const std::string &text) = 0;

  virtual const std::string &model_id() const = 0;
};

}  // namespace rentwise_core
