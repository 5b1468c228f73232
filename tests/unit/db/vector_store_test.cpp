#include <faiss/IndexFlat.h>
#include <faiss/index_io.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <map>
#include <thread>

#include "rentwise_core/db/docstore.hpp"
#include "rentwise_core/db/vector_store.hpp"
#include "rentwise_core/errors.hpp"
#include "../../common/utilities_test.hpp"

namespace rentwise_core {

using rentwise_tests::TestUtilities;

namespace {

class FixedEmbeddingProvider : public EmbeddingProvider {
 public:
  explicit FixedEmbeddingProvider(std::map<std::string, std::vector<float>> vectors) : vectors_(std::move(vectors)) {}

  std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) override {
    std::vector<std::vector<float>> result;
    for (const auto& text : texts) {
      result.push_back(vectors_.at(text));
    }
    return result;
  }

  std::vector<float> embed_query(const std::string& text) override {
    return vectors_.at(text);
  }

  const std::string& model_id() const override {
    return model_id_;
  }

 private:
  std::map<std::string, std::vector<float>> vectors_;
  std::string model_id_ = "fixed";
};

}  // namespace

class VectorStoreTest : public rentwise_tests::VectorStoreTestBase {
 protected:
  std::vector<DocumentChunk> rental_chunks() {
    return TestUtilities::create_test_chunks({
        "Minimum lease period for renting out an HDB flat is six months.",
        "Student Pass holders may rent HDB rooms but not whole flats.",
        "Property agents must be licensed by the CEA before they transact.",
        "Private condominiums have a minimum rental period of three months.",
        "Landlords must register their tenants with HDB within seven days.",
    });
  }

  std::vector<std::string> contents(const std::vector<CandidateChunk>& candidates) {
    std::vector<std::string> result;
    for (const auto& candidate : candidates) {
      result.push_back(candidate.chunk.content);
    }
    return result;
  }

  const std::string index_name_ = "singapore_rental";
};

TEST_F(VectorStoreTest, NewStoreIsEmpty) {
  EXPECT_TRUE(store_->empty());
  EXPECT_EQ(store_->dimension(), 0);
  EXPECT_TRUE(store_->similarity_search(embeddings_->embed_query("lease"), 5).empty());
  EXPECT_EQ(store_->stats().embedding_model, "hashing-embed");
}

TEST_F(VectorStoreTest, NullEmbeddingProviderIsRejected) {
  EXPECT_THROW(VectorStore(nullptr), std::invalid_argument);
}

TEST_F(VectorStoreTest, AddChunksSizesIndexToFirstEmbedding) {
  EXPECT_EQ(store_->add_chunks(rental_chunks()), 5u);

  EXPECT_EQ(store_->size(), 5u);
  EXPECT_EQ(store_->dimension(), 256);
  EXPECT_TRUE(store_->contains_content("Student Pass holders may rent HDB rooms but not whole flats."));
  EXPECT_FALSE(store_->contains_content("Not stored."));
}

TEST_F(VectorStoreTest, DuplicateContentIsSkippedWithoutEmbedding) {
  store_->add_chunks(rental_chunks());
  const size_t calls = embeddings_->embed_calls();

  EXPECT_EQ(store_->add_chunks(rental_chunks()), 0u);
  EXPECT_EQ(embeddings_->embed_calls(), calls);
  EXPECT_EQ(store_->size(), 5u);
}

TEST_F(VectorStoreTest, DuplicatesWithinOneBatchAreStoredOnce) {
  auto chunks = rental_chunks();
  chunks.push_back(chunks.front());

  EXPECT_EQ(store_->add_chunks(chunks), 5u);
  EXPECT_EQ(store_->size(), 5u);
}

TEST_F(VectorStoreTest, SimilaritySearchFindsClosestChunkFirst) {
  store_->add_chunks(rental_chunks());

  auto results = store_->similarity_search(
      embeddings_->embed_query("Property agents must be licensed by the CEA before they transact."), 3);

  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0].chunk.content, "Property agents must be licensed by the CEA before they transact.");
  EXPECT_NEAR(results[0].distance, 0.0f, 1e-4);
  EXPECT_LE(results[0].distance, results[1].distance);
  EXPECT_LE(results[1].distance, results[2].distance);
  EXPECT_EQ(results[0].chunk.metadata.url, "https://www.hdb.gov.sg/page2");
}

TEST_F(VectorStoreTest, SearchReturnsAtMostStoreSize) {
  store_->add_chunks(rental_chunks());
  EXPECT_EQ(store_->similarity_search(embeddings_->embed_query("lease"), 15).size(), 5u);
}

TEST_F(VectorStoreTest, WrongQueryDimensionThrows) {
  store_->add_chunks(rental_chunks());
  EXPECT_THROW(store_->similarity_search(std::vector<float>(3, 0.5f), 2), VectorStoreError);
}

TEST_F(VectorStoreTest, MmrPrefersDiverseResults) {
  // B nearly duplicates A; C is less similar to the query but adds coverage
  auto fixed = std::make_shared<FixedEmbeddingProvider>(std::map<std::string, std::vector<float>>{
      {"A", {0.995f, 0.0998f, 0.0f}},
      {"B", {0.980f, 0.199f, 0.0f}},
      {"C", {0.70f, -0.10f, 0.71f}},
  });
  VectorStore store(fixed);
  store.add_chunks(TestUtilities::create_test_chunks({"A", "B", "C"}));
  const std::vector<float> query = {1.0f, 0.0f, 0.0f};

  EXPECT_EQ(contents(store.similarity_search(query, 2)), (std::vector<std::string>{"A", "B"}));
  EXPECT_EQ(contents(store.max_marginal_relevance_search(query, 2, 4, 0.5f)),
            (std::vector<std::string>{"A", "C"}));
  // lambda 1 is pure relevance
  EXPECT_EQ(contents(store.max_marginal_relevance_search(query, 2, 4, 1.0f)),
            (std::vector<std::string>{"A", "B"}));
}

TEST_F(VectorStoreTest, MmrIsDeterministic) {
  store_->add_chunks(rental_chunks());
  const auto query = embeddings_->embed_query("minimum rental period for HDB");

  auto first = contents(store_->max_marginal_relevance_search(query, 3, 5, 0.5f));
  auto second = contents(store_->max_marginal_relevance_search(query, 3, 5, 0.5f));

  ASSERT_EQ(first.size(), 3u);
  EXPECT_EQ(first, second);
}

TEST_F(VectorStoreTest, SaveThenLoadAnswersTheSameQueries) {
  store_->add_chunks(rental_chunks());
  store_->save(temp_dir_, index_name_);

  EXPECT_TRUE(std::filesystem::exists(temp_dir_ / "singapore_rental.faiss"));
  EXPECT_TRUE(std::filesystem::exists(temp_dir_ / "singapore_rental.docstore"));
  EXPECT_FALSE(std::filesystem::exists(temp_dir_ / "singapore_rental.faiss.tmp"));

  auto loaded = VectorStore::load(temp_dir_, index_name_, embeddings_);
  ASSERT_NE(loaded, nullptr);
  EXPECT_EQ(loaded->size(), 5u);
  EXPECT_EQ(loaded->dimension(), 256);

  for (const auto& chunk : rental_chunks()) {
    const auto query = embeddings_->embed_query(chunk.content);
    auto before = store_->similarity_search(query, 1);
    auto after = loaded->similarity_search(query, 1);
    ASSERT_EQ(after.size(), 1u);
    EXPECT_EQ(after[0].chunk.content, chunk.content);
    EXPECT_EQ(after[0].chunk.content, before[0].chunk.content);
    EXPECT_EQ(after[0].chunk.metadata.title, chunk.metadata.title);
  }
}

TEST_F(VectorStoreTest, LoadedStoreKeepsDeduplicating) {
  store_->add_chunks(rental_chunks());
  store_->save(temp_dir_, index_name_);

  auto loaded = VectorStore::load(temp_dir_, index_name_, embeddings_);
  ASSERT_NE(loaded, nullptr);
  EXPECT_EQ(loaded->add_chunks(rental_chunks()), 0u);
}

TEST_F(VectorStoreTest, SavingEmptyStoreThrows) {
  EXPECT_THROW(store_->save(temp_dir_, index_name_), VectorStoreError);
}

TEST_F(VectorStoreTest, LoadReturnsNullWhenFilesAreMissing) {
  EXPECT_EQ(VectorStore::load(temp_dir_, index_name_, embeddings_), nullptr);

  store_->add_chunks(rental_chunks());
  store_->save(temp_dir_, index_name_);
  std::filesystem::remove(VectorStore::docstore_path(temp_dir_, index_name_));
  EXPECT_EQ(VectorStore::load(temp_dir_, index_name_, embeddings_), nullptr);
}

TEST_F(VectorStoreTest, LoadReturnsNullWhenPathCannotBeChecked) {
  // Longer than any file name the filesystem accepts
  const std::string overlong_name(300, 'r');

  std::unique_ptr<VectorStore> loaded;
  EXPECT_NO_THROW(loaded = VectorStore::load(temp_dir_, overlong_name, embeddings_));
  EXPECT_EQ(loaded, nullptr);
}

TEST_F(VectorStoreTest, SaveClearsUnsavedChanges) {
  EXPECT_FALSE(store_->has_unsaved_changes());

  store_->add_chunks(rental_chunks());
  EXPECT_TRUE(store_->has_unsaved_changes());

  store_->save(temp_dir_, index_name_);
  EXPECT_FALSE(store_->has_unsaved_changes());

  store_->add_chunks(rental_chunks());
  EXPECT_FALSE(store_->has_unsaved_changes());

  auto loaded = VectorStore::load(temp_dir_, index_name_, embeddings_);
  ASSERT_NE(loaded, nullptr);
  EXPECT_FALSE(loaded->has_unsaved_changes());
}

TEST_F(VectorStoreTest, LoadReturnsNullForCorruptIndex) {
  store_->add_chunks(rental_chunks());
  store_->save(temp_dir_, index_name_);
  TestUtilities::write_file(VectorStore::index_path(temp_dir_, index_name_), "not a faiss index");

  EXPECT_EQ(VectorStore::load(temp_dir_, index_name_, embeddings_), nullptr);
}

TEST_F(VectorStoreTest, LoadReturnsNullForCorruptDocstore) {
  store_->add_chunks(rental_chunks());
  store_->save(temp_dir_, index_name_);
  TestUtilities::write_file(VectorStore::docstore_path(temp_dir_, index_name_), std::string(4096, 'x'));

  EXPECT_EQ(VectorStore::load(temp_dir_, index_name_, embeddings_), nullptr);
}

TEST_F(VectorStoreTest, LoadReturnsNullForEmptyIndex) {
  faiss::IndexFlatL2 empty_index(256);
  faiss::write_index(&empty_index, VectorStore::index_path(temp_dir_, index_name_).c_str());
  DocStoreManifest manifest;
  manifest.dimension = 256;
  DocStore::write(VectorStore::docstore_path(temp_dir_, index_name_), manifest, {});

  EXPECT_EQ(VectorStore::load(temp_dir_, index_name_, embeddings_), nullptr);
}

TEST_F(VectorStoreTest, LoadReturnsNullForMismatchedPair) {
  store_->add_chunks(rental_chunks());
  store_->save(temp_dir_, index_name_);

  auto other = std::make_shared<VectorStore>(embeddings_);
  other->add_chunks(TestUtilities::create_test_chunks({"one chunk", "two chunk", "three chunk"}));
  other->save(temp_dir_, "other");

  std::filesystem::copy_file(VectorStore::index_path(temp_dir_, "other"),
                             VectorStore::index_path(temp_dir_, index_name_),
                             std::filesystem::copy_options::overwrite_existing);

  EXPECT_EQ(VectorStore::load(temp_dir_, index_name_, embeddings_), nullptr);
}

TEST_F(VectorStoreTest, LoadWithDifferentEmbeddingModelStillLoads) {
  store_->add_chunks(rental_chunks());
  store_->save(temp_dir_, index_name_);

  auto other_model = std::make_shared<rentwise_tests::HashingEmbeddingProvider>(256, "other-embed");
  auto loaded = VectorStore::load(temp_dir_, index_name_, other_model);

  ASSERT_NE(loaded, nullptr);
  EXPECT_EQ(loaded->stats().embedding_model, "hashing-embed");
}

TEST_F(VectorStoreTest, CreateFromChunks) {
  auto store = VectorStore::create_from_chunks(rental_chunks(), embeddings_);
  EXPECT_EQ(store->size(), 5u);
}

TEST_F(VectorStoreTest, ConcurrentSearchesDuringAdds) {
  store_->add_chunks(rental_chunks());
  const auto query = embeddings_->embed_query("HDB lease");

  std::vector<std::thread> readers;
  for (int t = 0; t < 4; ++t) {
    readers.emplace_back([this, &query]() {
      for (int i = 0; i < 50; ++i) {
        auto results = store_->similarity_search(query, 3);
        EXPECT_EQ(results.size(), 3u);
      }
    });
  }
  std::thread writer([this]() {
    for (int i = 0; i < 20; ++i) {
      store_->add_chunks(TestUtilities::create_test_chunks({"extra chunk number " + std::to_string(i)}));
    }
  });

  for (auto& reader : readers) {
    reader.join();
  }
  writer.join();
  EXPECT_EQ(store_->size(), 25u);
}

}  // namespace rentwise_core
