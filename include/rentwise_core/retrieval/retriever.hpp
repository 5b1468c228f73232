#pragma once

#include <memory>
#include <string>
#include <vector>

#include "rentwise_core/db/vector_store.hpp"
#include "rentwise_core/types/chunk.hpp"

namespace rentwise_core {

enum class SearchMode { Similarity, Mmr };

std::string to_string(SearchMode mode);
// Throws std::invalid_argument for anything but "similarity" or "mmr"
SearchMode search_mode_from_string(const std::string &str);

struct RetrieverOptions {
  size_t k = 15;
  SearchMode mode = SearchMode::Similarity;
  // MMR draws from the k * fetch_multiplier nearest chunks
  size_t fetch_multiplier = 2;
  float mmr_lambda = 0.5f;
};

// First retrieval stage bound to one store, k and search mode. Candidate
// scores are L2 distances (lower is closer). Both modes are deterministic for
// a fixed store and query.
class Retriever {
 public:
  Retriever(std::shared_ptr<const VectorStore> vector_store, RetrieverOptions options);

  // At most k candidates; fewer only when the store holds fewer chunks.
  // Throws ModelUnavailableError if the query cannot be embedded and
  // VectorStoreError if the search fails.
  std::vector<CandidateChunk> retrieve(const std::string &query) const;

  const RetrieverOptions &options() const {
    return options_;
  }

 private:
  std::shared_ptr<const VectorStore> vector_store_;
  RetrieverOptions options_;
};

}  // namespace rentwise_core
