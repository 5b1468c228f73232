#pragma once

#include <string>
#include <utility>
#include <vector>

namespace rentwise_core {

using TextPair = std::pair<std::string, std::string>;

// Pairwise relevance model. predict returns one score per pair, in input
// order, higher meaning more relevant. Implementations must be safe to call
// from several threads at once and throw ModelUnavailableError on failure.
class CrossEncoder {
 public:
  virtual ~CrossEncoder() = default;

  virtual std::vector<float> predict(const std::vector<TextPair> &pairs) = 0;
};

}  // namespace rentwise_core
