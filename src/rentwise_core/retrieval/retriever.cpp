#include "rentwise_core/retrieval/retriever.hpp"

#include <stdexcept>

namespace rentwise_core {

std::string to_string(SearchMode mode) {
  switch (mode) {
    case SearchMode::Similarity:
      return "similarity";
    case SearchMode::Mmr:
      return "mmr";
    default:
      return "unknown";
  }
}

SearchMode search_mode_from_string(const std::string &str) {
  if (str == "similarity")
    return SearchMode::Similarity;
  if (str == "mmr")
    return SearchMode::Mmr;
  throw std::invalid_argument("Unknown search type: " + str);
}

Retriever::Retriever(std::shared_ptr<const VectorStore> vector_store, RetrieverOptions options)
    : vector_store_(std::move(vector_store)), options_(options) {
  if (!vector_store_) {
    throw std::invalid_argument("Retriever requires a vector store");
  }
  if (options_.k == 0) {
    throw std::invalid_argument("Retriever k must be positive");
  }
  if (options_.fetch_multiplier == 0) {
    throw std::invalid_argument("MMR fetch multiplier must be positive");
  }
}

std::vector<CandidateChunk> Retriever::retrieve(const std::string &query) const {
  if (vector_store_->empty()) {
    return {};
  }

  std::vector<float> query_vector = vector_store_->embeddings()->embed_query(query);

  if (options_.mode == SearchMode::Mmr) {
    return vector_store_->max_marginal_relevance_search(
        query_vector, options_.k, options_.k * options_.fetch_multiplier, options_.mmr_lambda);
  }
  return vector_store_->similarity_search(query_vector, options_.k);
}

}  // namespace rentwise_core
