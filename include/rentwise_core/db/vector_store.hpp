#pragma once

#include <faiss/Index.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "rentwise_core/db/docstore.hpp"
#include "rentwise_core/llm/embedding_provider.hpp"
#include "rentwise_core/types/chunk.hpp"

namespace rentwise_core {

struct VectorStoreStats {
  size_t vector_count = 0;
  int dimension = 0;
  std::string embedding_model;
};

// Exact nearest-neighbour store over document chunks. Vector ordinal i in
// the FAISS index always corresponds to chunks_[i]. Searches take a shared
// lock and mutations an exclusive one, so a reader never sees an index and
// chunk list of different lengths.
//
// On disk a store is the pair {index_name}.faiss and {index_name}.docstore.
class VectorStore {
 public:
  static constexpr const char *INDEX_EXTENSION = ".faiss";
  static constexpr const char *DOCSTORE_EXTENSION = ".docstore";

  // Empty store. The index is created on the first add, sized to the
  // dimension of the first embedding.
  explicit VectorStore(std::shared_ptr<EmbeddingProvider> embeddings);
  ~VectorStore();

  VectorStore(const VectorStore &) = delete;
  VectorStore &operator=(const VectorStore &) = delete;
  VectorStore(VectorStore &&) = delete;
  VectorStore &operator=(VectorStore &&) = delete;

  // Returns nullptr when either file is missing, cannot be read, holds zero
  // vectors or the pair disagrees. The reason is logged.
  static std::unique_ptr<VectorStore> load(const std::filesystem::path &dir,
                                           const std::string &index_name,
                                           std::shared_ptr<EmbeddingProvider> embeddings);

  static std::unique_ptr<VectorStore> create_from_chunks(
      const std::vector<DocumentChunk> &chunks, std::shared_ptr<EmbeddingProvider> embeddings);

  // Embeds and appends the chunks whose content is not stored yet. Returns
  // how many were appended.
  size_t add_chunks(const std::vector<DocumentChunk> &chunks);

  // Throws VectorStoreError or DocStoreError. A successful save clears
  // has_unsaved_changes().
  void save(const std::filesystem::path &dir, const std::string &index_name) const;

  // True once add_chunks appended something that no save has written yet
  bool has_unsaved_changes() const {
    return unsaved_changes_.load();
  }

  // Candidates in ascending L2 distance, ties by ordinal
  std::vector<CandidateChunk> similarity_search(const std::vector<float> &query_vector,
                                                size_t k) const;

  // Maximal marginal relevance over the fetch_k nearest candidates
  std::vector<CandidateChunk> max_marginal_relevance_search(const std::vector<float> &query_vector,
                                                            size_t k, size_t fetch_k,
                                                            float lambda) const;

  size_t size() const;
  bool empty() const;
  int dimension() const;
  bool contains_content(const std::string &content) const;
  VectorStoreStats stats() const;

  const std::shared_ptr<EmbeddingProvider> &embeddings() const {
    return embeddings_;
  }

  static std::filesystem::path index_path(const std::filesystem::path &dir,
                                          const std::string &index_name);
  static std::filesystem::path docstore_path(const std::filesystem::path &dir,
                                             const std::string &index_name);

 private:
  struct Neighbour {
    int64_t ordinal;
    float distance;
  };

  // Callers hold mutex_
  std::vector<Neighbour> search_unlocked(const std::vector<float> &query_vector, size_t k) const;
  CandidateChunk make_candidate(const Neighbour &neighbour) const;

  std::shared_ptr<EmbeddingProvider> embeddings_;
  std::string embedding_model_;

  mutable std::shared_mutex mutex_;
  std::unique_ptr<faiss::Index> index_;
  std::vector<StoredChunk> chunks_;
  std::unordered_set<std::string> content_hashes_;
  mutable std::atomic<bool> unsaved_changes_{false};
};

}  // namespace rentwise_core
