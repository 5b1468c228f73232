#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "rentwise_core/db/vector_store.hpp"
#include "rentwise_core/llm/embedding_provider.hpp"
#include "rentwise_core/ranking/cross_encoder.hpp"
#include "rentwise_core/types/chunk.hpp"

namespace rentwise_tests {

/**
 * Deterministic bag-of-words embedder. Each lowercased word is hashed into one
 * of `dimension` buckets, so texts sharing words land close together.
 */
class HashingEmbeddingProvider : public rentwise_core::EmbeddingProvider {
 public:
  explicit HashingEmbeddingProvider(int dimension = 256, std::string model_id = "hashing-embed");

  std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) override;
  std::vector<float> embed_query(const std::string& text) override;

  const std::string& model_id() const override {
    return model_id_;
  }

  size_t embed_calls() const {
    return embed_calls_;
  }

 private:
  int dimension_;
  std::string model_id_;
  size_t embed_calls_ = 0;
};

/**
 * Scores a pair by how many distinct query words appear in the passage.
 */
class KeywordOverlapCrossEncoder : public rentwise_core::CrossEncoder {
 public:
  std::vector<float> predict(const std::vector<rentwise_core::TextPair>& pairs) override;
};

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  static std::filesystem::path create_temp_dir(const std::string& prefix = "rentwise_test");
  static void cleanup_temp_dir(const std::filesystem::path& dir);

  static void write_file(const std::filesystem::path& path, const std::string& contents);
  static std::string read_file(const std::filesystem::path& path);

  static std::vector<std::string> words(const std::string& text);

  // Distinct rental-topic chunks, one per entry of topics
  static std::vector<rentwise_core::DocumentChunk> create_test_chunks(
      const std::vector<std::string>& topics, const std::string& url_prefix = "https://www.hdb.gov.sg/page");

  // Long enough to survive min_content_length filtering
  static std::string create_long_text(const std::string& topic, int sentences = 12);
};

/**
 * Base fixture owning a fresh temporary directory per test
 */
class TempDirTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = TestUtilities::create_temp_dir();
  }

  void TearDown() override {
    TestUtilities::cleanup_temp_dir(temp_dir_);
  }

  std::filesystem::path temp_dir_;
};

/**
 * Base fixture with a hashing embedder and an empty store
 */
class VectorStoreTestBase : public TempDirTestBase {
 protected:
  void SetUp() override {
    TempDirTestBase::SetUp();
    embeddings_ = std::make_shared<HashingEmbeddingProvider>();
    store_ = std::make_shared<rentwise_core::VectorStore>(embeddings_);
  }

  std::shared_ptr<HashingEmbeddingProvider> embeddings_;
  std::shared_ptr<rentwise_core::VectorStore> store_;
};

}  // namespace rentwise_tests
