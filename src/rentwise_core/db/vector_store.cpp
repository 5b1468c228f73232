#include "rentwise_core/db/vector_store.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/impl/FaissException.h>
#include <faiss/index_io.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <mutex>
#include <stdexcept>

#include "rentwise_core/errors.hpp"
#include "rentwise_core/util/content_hash.hpp"

namespace rentwise_core {

namespace {

float cosine_similarity(const float *a, const float *b, int dimension) {
  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (int i = 0; i < dimension; ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    norm_a += static_cast<double>(a[i]) * a[i];
    norm_b += static_cast<double>(b[i]) * b[i];
  }
  if (norm_a == 0.0 || norm_b == 0.0) {
    return 0.0f;
  }
  return static_cast<float>(dot / (std::sqrt(norm_a) * std::sqrt(norm_b)));
}

}  // namespace

VectorStore::VectorStore(std::shared_ptr<EmbeddingProvider> embeddings)
    : embeddings_(std::move(embeddings)) {
  if (!embeddings_) {
    throw std::invalid_argument("VectorStore requires an embedding provider");
  }
  embedding_model_ = embeddings_->model_id();
}

VectorStore::~VectorStore() = default;

std::filesystem::path VectorStore::index_path(const std::filesystem::path &dir,
                                              const std::string &index_name) {
  return dir / (index_name + INDEX_EXTENSION);
}

std::filesystem::path VectorStore::docstore_path(const std::filesystem::path &dir,
                                                 const std::string &index_name) {
  return dir / (index_name + DOCSTORE_EXTENSION);
}

std::unique_ptr<VectorStore> VectorStore::load(const std::filesystem::path &dir,
                                               const std::string &index_name,
                                               std::shared_ptr<EmbeddingProvider> embeddings) {
  const auto faiss_file = index_path(dir, index_name);
  const auto docstore_file = docstore_path(dir, index_name);

  std::error_code ec;
  const bool index_exists = std::filesystem::exists(faiss_file, ec);
  const bool docstore_exists = !ec && std::filesystem::exists(docstore_file, ec);
  if (ec) {
    std::cerr << "Vector index '" << index_name << "' in " << dir << " is unreadable: "
              << ec.message() << std::endl;
    return nullptr;
  }
  if (!index_exists || !docstore_exists) {
    std::cerr << "Vector index '" << index_name << "' is missing in " << dir
              << " (need both " << faiss_file.filename() << " and " << docstore_file.filename()
              << ")" << std::endl;
    return nullptr;
  }

  std::unique_ptr<faiss::Index> index;
  try {
    index.reset(faiss::read_index(faiss_file.c_str()));
  } catch (const std::exception &e) {
    std::cerr << "Vector index " << faiss_file << " is corrupt: " << e.what() << std::endl;
    return nullptr;
  }
  if (!index || index->metric_type != faiss::METRIC_L2) {
    std::cerr << "Vector index " << faiss_file << " is corrupt: not an L2 index" << std::endl;
    return nullptr;
  }
  if (index->ntotal == 0) {
    std::cerr << "Vector index " << faiss_file << " is empty" << std::endl;
    return nullptr;
  }

  DocStoreContents contents;
  std::string index_sha256;
  try {
    contents = DocStore::read(docstore_file);
    index_sha256 = sha256_file_hex(faiss_file);
  } catch (const DocStoreError &e) {
    std::cerr << "Docstore " << docstore_file << " is corrupt: " << e.what() << std::endl;
    return nullptr;
  } catch (const std::runtime_error &e) {
    std::cerr << "Vector index " << faiss_file << " is unreadable: " << e.what() << std::endl;
    return nullptr;
  }

  const auto &manifest = contents.manifest;
  if (manifest.vector_count != index->ntotal ||
      contents.chunks.size() != static_cast<size_t>(index->ntotal) ||
      manifest.dimension != index->d || manifest.index_sha256 != index_sha256) {
    std::cerr << "Vector index '" << index_name << "' is inconsistent: index holds "
              << index->ntotal << " vectors of dimension " << index->d << ", docstore records "
              << manifest.vector_count << " (" << contents.chunks.size() << " rows) of dimension "
              << manifest.dimension
              << (manifest.index_sha256 != index_sha256 ? ", index checksum differs" : "")
              << std::endl;
    return nullptr;
  }

  auto store = std::make_unique<VectorStore>(std::move(embeddings));
  if (!manifest.embedding_model.empty() &&
      manifest.embedding_model != store->embeddings_->model_id()) {
    std::cerr << "Warning: vector index '" << index_name << "' was built with embedding model '"
              << manifest.embedding_model << "' but '" << store->embeddings_->model_id()
              << "' is active; search quality will suffer" << std::endl;
  }

  store->embedding_model_ = manifest.embedding_model.empty() ? store->embedding_model_
                                                             : manifest.embedding_model;
  store->index_ = std::move(index);
  store->chunks_ = std::move(contents.chunks);
  for (const auto &stored : store->chunks_) {
    store->content_hashes_.insert(stored.content_hash);
  }

  std::cout << "Loaded vector index '" << index_name << "' with " << store->chunks_.size()
            << " chunks" << std::endl;
  return store;
}

std::unique_ptr<VectorStore> VectorStore::create_from_chunks(
    const std::vector<DocumentChunk> &chunks, std::shared_ptr<EmbeddingProvider> embeddings) {
  auto store = std::make_unique<VectorStore>(std::move(embeddings));
  store->add_chunks(chunks);
  return store;
}

size_t VectorStore::add_chunks(const std::vector<DocumentChunk> &chunks) {
  // Embedding is slow, so it happens before the writer lock is taken
  std::vector<StoredChunk> pending;
  {
    std::shared_lock lock(mutex_);
    std::unordered_set<std::string> batch_hashes;
    for (const auto &chunk : chunks) {
      std::string hash = sha256_hex(chunk.content);
      if (content_hashes_.count(hash) > 0 || !batch_hashes.insert(hash).second) {
        continue;
      }
      pending.push_back(StoredChunk{chunk, std::move(hash)});
    }
  }
  if (pending.empty()) {
    return 0;
  }

  std::vector<std::string> texts;
  texts.reserve(pending.size());
  for (const auto &stored : pending) {
    texts.push_back(stored.chunk.content);
  }
  std::vector<std::vector<float>> vectors = embeddings_->embed(texts);
  if (vectors.size() != pending.size()) {
    throw VectorStoreError("Embedding provider returned " + std::to_string(vectors.size()) +
                           " vectors for " + std::to_string(pending.size()) + " chunks");
  }

  std::unique_lock lock(mutex_);
  const int dimension = index_ ? static_cast<int>(index_->d)
                               : static_cast<int>(vectors.front().size());
  if (dimension <= 0) {
    throw VectorStoreError("Embedding provider returned an empty vector");
  }

  std::vector<float> flat;
  std::vector<StoredChunk> accepted;
  flat.reserve(vectors.size() * dimension);
  for (size_t i = 0; i < pending.size(); ++i) {
    if (vectors[i].size() != static_cast<size_t>(dimension)) {
      throw VectorStoreError("Vector dimension mismatch. Expected " + std::to_string(dimension) +
                             ", got " + std::to_string(vectors[i].size()));
    }
    // Another writer may have stored the same content while we were embedding
    if (content_hashes_.count(pending[i].content_hash) > 0) {
      continue;
    }
    flat.insert(flat.end(), vectors[i].begin(), vectors[i].end());
    accepted.push_back(std::move(pending[i]));
  }
  if (accepted.empty()) {
    return 0;
  }

  try {
    if (!index_) {
      index_ = std::make_unique<faiss::IndexFlatL2>(dimension);
    }
    index_->add(static_cast<faiss::idx_t>(accepted.size()), flat.data());
  } catch (const faiss::FaissException &e) {
    throw VectorStoreError("Failed to add vectors: " + std::string(e.what()));
  }

  for (auto &stored : accepted) {
    content_hashes_.insert(stored.content_hash);
    chunks_.push_back(std::move(stored));
  }
  unsaved_changes_ = true;
  return accepted.size();
}

void VectorStore::save(const std::filesystem::path &dir, const std::string &index_name) const {
  std::shared_lock lock(mutex_);
  if (!index_ || index_->ntotal == 0) {
    throw VectorStoreError("Refusing to save an empty vector index");
  }

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw VectorStoreError("Cannot create index directory " + dir.string() + ": " + ec.message());
  }

  const auto final_index = index_path(dir, index_name);
  const auto final_docstore = docstore_path(dir, index_name);
  auto tmp_index = final_index;
  tmp_index += ".tmp";
  auto tmp_docstore = final_docstore;
  tmp_docstore += ".tmp";

  try {
    faiss::write_index(index_.get(), tmp_index.c_str());
  } catch (const faiss::FaissException &e) {
    throw VectorStoreError("Failed to write " + tmp_index.string() + ": " + e.what());
  }

  DocStoreManifest manifest;
  manifest.format_version = DocStore::FORMAT_VERSION;
  manifest.vector_count = index_->ntotal;
  manifest.dimension = static_cast<int>(index_->d);
  manifest.embedding_model = embedding_model_;
  try {
    manifest.index_sha256 = sha256_file_hex(tmp_index);
  } catch (const std::runtime_error &e) {
    throw VectorStoreError(e.what());
  }
  DocStore::write(tmp_docstore, manifest, chunks_);

  // The docstore goes last: until it lands, its checksum does not match
  // the new index and load() rejects the pair.
  std::filesystem::rename(tmp_index, final_index, ec);
  if (ec) {
    throw VectorStoreError("Failed to move " + tmp_index.string() + " into place: " +
                           ec.message());
  }
  std::filesystem::rename(tmp_docstore, final_docstore, ec);
  if (ec) {
    throw VectorStoreError("Failed to move " + tmp_docstore.string() + " into place: " +
                           ec.message());
  }

  unsaved_changes_ = false;
  std::cout << "Saved vector index '" << index_name << "' (" << chunks_.size() << " chunks) to "
            << dir << std::endl;
}

std::vector<VectorStore::Neighbour> VectorStore::search_unlocked(
    const std::vector<float> &query_vector, size_t k) const {
  if (!index_ || index_->ntotal == 0 || k == 0) {
    return {};
  }
  if (query_vector.size() != static_cast<size_t>(index_->d)) {
    throw VectorStoreError("Query vector dimension mismatch. Expected " +
                           std::to_string(index_->d) + ", got " +
                           std::to_string(query_vector.size()));
  }

  const auto actual_k = static_cast<faiss::idx_t>(
      std::min(k, static_cast<size_t>(index_->ntotal)));
  std::vector<float> distances(actual_k);
  std::vector<faiss::idx_t> labels(actual_k);
  try {
    index_->search(1, query_vector.data(), actual_k, distances.data(), labels.data());
  } catch (const faiss::FaissException &e) {
    throw VectorStoreError("Vector search failed: " + std::string(e.what()));
  }

  std::vector<Neighbour> neighbours;
  neighbours.reserve(actual_k);
  for (faiss::idx_t i = 0; i < actual_k; ++i) {
    if (labels[i] >= 0) {
      neighbours.push_back({labels[i], distances[i]});
    }
  }
  std::sort(neighbours.begin(), neighbours.end(), [](const Neighbour &a, const Neighbour &b) {
    return a.distance != b.distance ? a.distance < b.distance : a.ordinal < b.ordinal;
  });
  return neighbours;
}

CandidateChunk VectorStore::make_candidate(const Neighbour &neighbour) const {
  return CandidateChunk{chunks_.at(static_cast<size_t>(neighbour.ordinal)).chunk,
                        neighbour.distance};
}

std::vector<CandidateChunk> VectorStore::similarity_search(const std::vector<float> &query_vector,
                                                           size_t k) const {
  std::shared_lock lock(mutex_);
  std::vector<CandidateChunk> candidates;
  for (const auto &neighbour : search_unlocked(query_vector, k)) {
    candidates.push_back(make_candidate(neighbour));
  }
  return candidates;
}

std::vector<CandidateChunk> VectorStore::max_marginal_relevance_search(
    const std::vector<float> &query_vector, size_t k, size_t fetch_k, float lambda) const {
  std::shared_lock lock(mutex_);
  auto pool = search_unlocked(query_vector, std::max(fetch_k, k));
  if (pool.empty()) {
    return {};
  }

  const int dimension = static_cast<int>(index_->d);
  std::vector<float> pool_vectors(pool.size() * dimension);
  try {
    for (size_t i = 0; i < pool.size(); ++i) {
      index_->reconstruct(pool[i].ordinal, pool_vectors.data() + i * dimension);
    }
  } catch (const faiss::FaissException &e) {
    throw VectorStoreError("Failed to reconstruct vectors for MMR: " + std::string(e.what()));
  }

  std::vector<float> query_similarity(pool.size());
  for (size_t i = 0; i < pool.size(); ++i) {
    query_similarity[i] =
        cosine_similarity(query_vector.data(), pool_vectors.data() + i * dimension, dimension);
  }

  const size_t target = std::min(k, pool.size());
  std::vector<size_t> selected;
  std::vector<bool> taken(pool.size(), false);
  // Highest similarity to anything already selected, per pool entry
  std::vector<float> redundancy(pool.size(), -std::numeric_limits<float>::infinity());

  while (selected.size() < target) {
    size_t best = pool.size();
    float best_score = -std::numeric_limits<float>::infinity();
    for (size_t i = 0; i < pool.size(); ++i) {
      if (taken[i]) {
        continue;
      }
      const float penalty = selected.empty() ? 0.0f : redundancy[i];
      const float score = lambda * query_similarity[i] - (1.0f - lambda) * penalty;
      if (best == pool.size() || score > best_score) {
        best = i;
        best_score = score;
      }
    }

    taken[best] = true;
    selected.push_back(best);
    const float *chosen = pool_vectors.data() + best * dimension;
    for (size_t i = 0; i < pool.size(); ++i) {
      if (!taken[i]) {
        redundancy[i] = std::max(
            redundancy[i], cosine_similarity(pool_vectors.data() + i * dimension, chosen, dimension));
      }
    }
  }

  std::vector<CandidateChunk> candidates;
  candidates.reserve(selected.size());
  for (size_t index : selected) {
    candidates.push_back(make_candidate(pool[index]));
  }
  return candidates;
}

size_t VectorStore::size() const {
  std::shared_lock lock(mutex_);
  return chunks_.size();
}

bool VectorStore::empty() const {
  return size() == 0;
}

int VectorStore::dimension() const {
  std::shared_lock lock(mutex_);
  return index_ ? static_cast<int>(index_->d) : 0;
}

bool VectorStore::contains_content(const std::string &content) const {
  const std::string hash = sha256_hex(content);
  std::shared_lock lock(mutex_);
  return content_hashes_.count(hash) > 0;
}

VectorStoreStats VectorStore::stats() const {
  std::shared_lock lock(mutex_);
  VectorStoreStats stats;
  stats.vector_count = chunks_.size();
  stats.dimension = index_ ? static_cast<int>(index_->d) : 0;
  stats.embedding_model = embedding_model_;
  return stats;
}

}  // namespace rentwise_core
