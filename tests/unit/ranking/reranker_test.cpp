#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "rentwise_core/errors.hpp"
#include "rentwise_core/ranking/reranker.hpp"
#include "../../common/mocks_test.hpp"

namespace rentwise_core {

using rentwise_tests::MockUtilities::create_test_candidate;
using testing::_;
using testing::Return;

class RerankerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    cross_encoder_ = std::make_shared<testing::NiceMock<rentwise_tests::MockCrossEncoder>>();
    registry_ = std::make_shared<ModelRegistry>(nullptr, [this](const std::string&) -> std::shared_ptr<CrossEncoder> {
      ++loads_;
      return cross_encoder_;
    });
    reranker_ = std::make_unique<Reranker>(registry_, "ms-marco-MiniLM-L-6-v2");
  }

  std::vector<CandidateChunk> candidates(int count) {
    std::vector<CandidateChunk> result;
    for (int i = 0; i < count; ++i) {
      result.push_back(create_test_candidate("chunk " + std::to_string(i), static_cast<float>(i)));
    }
    return result;
  }

  std::shared_ptr<testing::NiceMock<rentwise_tests::MockCrossEncoder>> cross_encoder_;
  std::shared_ptr<ModelRegistry> registry_;
  std::unique_ptr<Reranker> reranker_;
  int loads_ = 0;
};

TEST_F(RerankerTest, EmptyInputSkipsTheModel) {
  EXPECT_CALL(*cross_encoder_, predict(_)).Times(0);

  EXPECT_TRUE(reranker_->rerank("Can I rent?", {}, 8).empty());
  EXPECT_EQ(loads_, 0);
}

TEST_F(RerankerTest, ZeroTopKSkipsTheModel) {
  EXPECT_CALL(*cross_encoder_, predict(_)).Times(0);

  EXPECT_TRUE(reranker_->rerank("Can I rent?", candidates(3), 0).empty());
}

TEST_F(RerankerTest, OrdersByDescendingScoreKeepingRetrievalOrderOnTies) {
  EXPECT_CALL(*cross_encoder_, predict(_)).WillOnce(Return(std::vector<float>{0.1f, 2.0f, -1.0f, 2.0f}));

  auto reranked = reranker_->rerank("query", candidates(4), 3);

  ASSERT_EQ(reranked.size(), 3u);
  EXPECT_EQ(reranked[0].chunk.content, "chunk 1");
  EXPECT_EQ(reranked[1].chunk.content, "chunk 3");
  EXPECT_EQ(reranked[2].chunk.content, "chunk 0");
  EXPECT_FLOAT_EQ(reranked[0].relevance_score, 2.0f);
  EXPECT_FLOAT_EQ(reranked[2].relevance_score, 0.1f);
}

TEST_F(RerankerTest, ReturnsEverythingWhenTopKExceedsInput) {
  EXPECT_CALL(*cross_encoder_, predict(_)).WillOnce(Return(std::vector<float>{-3.0f, 5.0f}));

  auto reranked = reranker_->rerank("query", candidates(2), 8);

  ASSERT_EQ(reranked.size(), 2u);
  EXPECT_EQ(reranked[0].chunk.content, "chunk 1");
  EXPECT_EQ(reranked[1].chunk.content, "chunk 0");
}

TEST_F(RerankerTest, TruncatesPassagesBeforeScoring) {
  std::vector<TextPair> seen;
  EXPECT_CALL(*cross_encoder_, predict(_))
      .WillOnce([&seen](const std::vector<TextPair>& pairs) {
        seen = pairs;
        return std::vector<float>(pairs.size(), 1.0f);
      });

  std::vector<CandidateChunk> input = {create_test_candidate(std::string(600, 'x')),
                                       create_test_candidate("short")};
  auto reranked = reranker_->rerank("Can students rent HDB rooms?", input, 2);

  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0].first, "Can students rent HDB rooms?");
  EXPECT_EQ(seen[0].second.size(), 500u);
  EXPECT_EQ(seen[1].second, "short");
  // The kept chunk is the full original, not the truncated passage
  EXPECT_EQ(reranked[0].chunk.content.size(), 600u);
}

TEST_F(RerankerTest, ModelFailurePropagates) {
  EXPECT_CALL(*cross_encoder_, predict(_)).WillOnce(testing::Throw(ModelUnavailableError("onnx failed")));

  EXPECT_THROW(reranker_->rerank("query", candidates(2), 2), ModelUnavailableError);
}

TEST_F(RerankerTest, ScoreCountMismatchIsModelUnavailable) {
  EXPECT_CALL(*cross_encoder_, predict(_)).WillOnce(Return(std::vector<float>{1.0f}));

  EXPECT_THROW(reranker_->rerank("query", candidates(2), 2), ModelUnavailableError);
}

TEST_F(RerankerTest, NanScoreIsModelUnavailable) {
  EXPECT_CALL(*cross_encoder_, predict(_))
      .WillOnce(Return(std::vector<float>{1.0f, std::numeric_limits<float>::quiet_NaN()}));

  EXPECT_THROW(reranker_->rerank("query", candidates(2), 2), ModelUnavailableError);
}

TEST_F(RerankerTest, UnloadableModelIsModelUnavailable) {
  auto registry = std::make_shared<ModelRegistry>(nullptr, [](const std::string& id) -> std::shared_ptr<CrossEncoder> {
    throw ModelUnavailableError("missing model file for " + id);
  });
  Reranker reranker(registry, "missing");

  EXPECT_THROW(reranker.rerank("query", candidates(1), 1), ModelUnavailableError);
}

}  // namespace rentwise_core
