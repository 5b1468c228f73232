#pragma once

#include <string>
#include <vector>

namespace rentwise_core {

struct TextSplitterOptions {
  // Lengths are measured in code points
  size_t chunk_size = 500;
  size_t chunk_overlap = 100;
  std::vector<std::string> separators = {"\n\n", "\n", " ", ""};
};

// Recursive character splitter. Splits on the first separator present in
// the text, merges neighbouring pieces into chunks of at most chunk_size
// with up to chunk_overlap carried over, and recurses with the next
// separator into any piece that is still too long. Separators stay attached
// to the start of the piece that follows them; chunks are trimmed and empty
// chunks dropped.
class TextSplitter {
 public:
  // Throws std::invalid_argument if chunk_overlap >= chunk_size
  explicit TextSplitter(TextSplitterOptions options = {});

  std::vector<std::string> split_text(const std::string &text) const;

 private:
  std::vector<std::string> split_recursive(const std::string &text,
                                           const std::vector<std::string> &separators) const;
  std::vector<std::string> merge_splits(const std::vector<std::string> &splits) const;

  TextSplitterOptions options_;
};

}  // namespace rentwise_core
