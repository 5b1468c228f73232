#pragma once

#include <memory>
#include <string>
#include <vector>

#include "rentwise_core/llm/model_registry.hpp"
#include "rentwise_core/types/chunk.hpp"

namespace rentwise_core {

// Second retrieval stage. Scores every (query, candidate) pair with the
// cross-encoder and keeps the top_k by descending score. Equal scores keep
// their retrieval order.
class Reranker {
 public:
  static constexpr size_t DEFAULT_MAX_CONTENT_CHARS = 500;

  Reranker(std::shared_ptr<ModelRegistry> registry, std::string model_id,
           size_t max_content_chars = DEFAULT_MAX_CONTENT_CHARS);

  // Returns an empty set for empty input without loading the model.
  // Throws ModelUnavailableError when the model cannot load or score.
  std::vector<RerankedChunk> rerank(const std::string &query,
                                    const std::vector<CandidateChunk> &candidates,
                                    size_t top_k) const;

  const std::string &model_id() const {
    return model_id_;
  }

 private:
  std::shared_ptr<ModelRegistry> registry_;
  std::string model_id_;
  size_t max_content_chars_;
};

}  // namespace rentwise_core
