#include "rentwise_core/ranking/reranker.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

#include "rentwise_core/errors.hpp"
#include "rentwise_core/text/utf8_prefix.hpp"

namespace rentwise_core {

Reranker::Reranker(std::shared_ptr<ModelRegistry> registry, std::string model_id,
                   size_t max_content_chars)
    : registry_(std::move(registry)),
      model_id_(std::move(model_id)),
      max_content_chars_(max_content_chars) {
  if (!registry_) {
    throw std::invalid_argument("Reranker requires a model registry");
  }
}

std::vector<RerankedChunk> Reranker::rerank(const std::string &query,
                                            const std::vector<CandidateChunk> &candidates,
                                            size_t top_k) const {
  if (candidates.empty() || top_k == 0) {
    return {};
  }

  auto cross_encoder = registry_->cross_encoder(model_id_);

  // Truncation only bounds model latency; every candidate is still scored
  std::vector<TextPair> pairs;
  pairs.reserve(candidates.size());
  for (const auto &candidate : candidates) {
    pairs.emplace_back(query, utf8_prefix(candidate.chunk.content, max_content_chars_));
  }

  std::vector<float> scores = cross_encoder->predict(pairs);
  if (scores.size() != candidates.size()) {
    throw ModelUnavailableError("Cross-encoder '" + model_id_ + "' returned " +
                                std::to_string(scores.size()) + " scores for " +
                                std::to_string(candidates.size()) + " pairs");
  }

  if (std::any_of(scores.begin(), scores.end(), [](float score) { return std::isnan(score); })) {
    throw ModelUnavailableError("Cross-encoder '" + model_id_ + "' produced a NaN score");
  }

  std::vector<size_t> order(candidates.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
                   [&scores](size_t a, size_t b) { return scores[a] > scores[b]; });
  order.resize(std::min(top_k, order.size()));

  std::vector<RerankedChunk> reranked;
  reranked.reserve(order.size());
  for (size_t index : order) {
    reranked.push_back(RerankedChunk{candidates[index].chunk, scores[index]});
  }
  return reranked;
}

}  // namespace rentwise_core
