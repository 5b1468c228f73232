#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "rentwise_core/errors.hpp"
#include "rentwise_core/retrieval/retriever.hpp"
#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

namespace rentwise_core {

using rentwise_tests::TestUtilities;

class RetrieverTest : public rentwise_tests::VectorStoreTestBase {
 protected:
  void SetUp() override {
    VectorStoreTestBase::SetUp();
    store_->add_chunks(TestUtilities::create_test_chunks({
        "Minimum lease period for renting out an HDB flat is six months.",
        "Student Pass holders may rent HDB rooms but not whole flats.",
        "Property agents must be licensed by the CEA before they transact.",
        "Private condominiums have a minimum rental period of three months.",
        "Landlords must register their tenants with HDB within seven days.",
    }));
  }

  Retriever make_retriever(size_t k, SearchMode mode = SearchMode::Similarity) {
    RetrieverOptions options;
    options.k = k;
    options.mode = mode;
    return Retriever(store_, options);
  }
};

TEST_F(RetrieverTest, ReturnsKNearestCandidates) {
  auto candidates = make_retriever(3).retrieve("Can Student Pass holders rent HDB rooms?");

  ASSERT_EQ(candidates.size(), 3u);
  EXPECT_EQ(candidates[0].chunk.content, "Student Pass holders may rent HDB rooms but not whole flats.");
  EXPECT_LE(candidates[0].distance, candidates[1].distance);
}

TEST_F(RetrieverTest, ReturnsFewerWhenStoreIsSmaller) {
  EXPECT_EQ(make_retriever(15).retrieve("lease").size(), 5u);
}

TEST_F(RetrieverTest, MmrModeHonoursK) {
  auto retriever = make_retriever(2, SearchMode::Mmr);
  auto first = retriever.retrieve("minimum rental period");
  auto second = retriever.retrieve("minimum rental period");

  ASSERT_EQ(first.size(), 2u);
  EXPECT_EQ(first[0].chunk.content, second[0].chunk.content);
  EXPECT_EQ(first[1].chunk.content, second[1].chunk.content);
}

TEST_F(RetrieverTest, RejectsInvalidOptions) {
  RetrieverOptions zero_k;
  zero_k.k = 0;
  EXPECT_THROW(Retriever(store_, zero_k), std::invalid_argument);
  EXPECT_THROW(Retriever(nullptr, RetrieverOptions{}), std::invalid_argument);
}

TEST(RetrieverEmptyStoreTest, EmptyStoreReturnsNothingWithoutEmbedding) {
  auto embeddings = std::make_shared<testing::StrictMock<rentwise_tests::MockEmbeddingProvider>>();
  auto store = std::make_shared<VectorStore>(embeddings);
  Retriever retriever(store, RetrieverOptions{});

  EXPECT_TRUE(retriever.retrieve("anything").empty());
}

TEST(RetrieverEmbeddingFailureTest, EmbeddingFailurePropagates) {
  auto embeddings = std::make_shared<testing::NiceMock<rentwise_tests::MockEmbeddingProvider>>();
  auto store = std::make_shared<VectorStore>(embeddings);
  store->add_chunks(TestUtilities::create_test_chunks({"one", "two"}));
  EXPECT_CALL(*embeddings, embed_query(testing::_))
      .WillOnce(testing::Throw(ModelUnavailableError("ollama unreachable")));

  Retriever retriever(store, RetrieverOptions{});
  EXPECT_THROW(retriever.retrieve("question"), ModelUnavailableError);
}

TEST(SearchModeTest, ParsesKnownModes) {
  EXPECT_EQ(search_mode_from_string("similarity"), SearchMode::Similarity);
  EXPECT_EQ(search_mode_from_string("mmr"), SearchMode::Mmr);
  EXPECT_EQ(to_string(SearchMode::Mmr), "mmr");
  EXPECT_THROW(search_mode_from_string("hybrid"), std::invalid_argument);
}

}  // namespace rentwise_core
