#include "rentwise_core/types/citation.hpp"

#include "rentwise_core/text/utf8_prefix.hpp"

namespace rentwise_core {

std::string make_snippet(const std::string &content, size_t max_chars) {
  std::string prefix = utf8_prefix(content, max_chars);
  if (prefix.size() == content.size()) {
    return content;
  }
  return prefix + SNIPPET_CONTINUATION;
}

Citation make_citation(const DocumentChunk &chunk) {
  Citation citation;
  citation.title = chunk.metadata.title.empty() ? UNKNOWN_TITLE : chunk.metadata.title;
  citation.url = chunk.metadata.url;
  citation.snippet = make_snippet(chunk.content);
  return citation;
}

std::vector<Citation> make_citations(const std::vector<RerankedChunk> &reranked) {
  std::vector<Citation> citations;
  citations.reserve(reranked.size());
  for (const auto &ranked : reranked) {
    citations.push_back(make_citation(ranked.chunk));
  }
  return citations;
}

}  // namespace rentwise_core
