#pragma once

#include <string>
#include <vector>

namespace rentwise_core {

inline constexpr const char *UNKNOWN_TITLE = "Unknown Title";

struct ChunkMetadata {
  std::string title = UNKNOWN_TITLE;
  // Empty means the chunk has no source link
  std::string url;
  std::string category;
};

struct DocumentChunk {
  std::string content;
  ChunkMetadata metadata;
};

// First-stage hit. distance is the squared L2 distance reported by the index,
// lower means closer.
struct CandidateChunk {
  DocumentChunk chunk;
  float distance = 0.0f;
};

// Cross-encoder output. relevance_score is the raw model logit, higher means
// more relevant.
struct RerankedChunk {
  DocumentChunk chunk;
  float relevance_score = 0.0f;
};

}  // namespace rentwise_core
