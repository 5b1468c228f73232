#pragma once

#include <string>
#include <vector>

#include "rentwise_core/types/chunk.hpp"

namespace rentwise_core {

struct Citation {
  std::string title;
  std::string url;
  std::string snippet;
};

inline constexpr size_t SNIPPET_MAX_CHARS = 200;
inline constexpr const char *SNIPPET_CONTINUATION = "...";

// Bounded prefix of content, counted in UTF-8 code points. Content at or under
// the bound is returned unchanged.
std::string make_snippet(const std::string &content, size_t max_chars = SNIPPET_MAX_CHARS);

Citation make_citation(const DocumentChunk &chunk);

std::vector<Citation> make_citations(const std::vector<RerankedChunk> &reranked);

}  // namespace rentwise_core
