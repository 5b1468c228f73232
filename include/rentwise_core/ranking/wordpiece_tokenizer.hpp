#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

#include "rentwise_core/ranking/cross_encoder.hpp"

namespace rentwise_core {

// BERT-style uncased WordPiece tokenizer for cross-encoder inputs.
class WordPieceTokenizer {
 public:
  struct PairBatchEncoding {
    std::vector<int64_t> input_ids;  // flattened [batch_size * sequence_length]
    std::vector<int64_t> attention_mask;
    std::vector<int64_t> token_type_ids;
    int batch_size = 0;
    int sequence_length = 0;
  };

  // Throws std::runtime_error if the vocab file is missing or empty
  explicit WordPieceTokenizer(const std::filesystem::path &vocab_path);

  // Builds a tokenizer from an in-memory vocab, one token per entry
  explicit WordPieceTokenizer(const std::vector<std::string> &vocab);

  // Lowercases and strips accents (Latin letters; Greek and Cyrillic are
  // lowercased only), splits on whitespace and punctuation, then applies greedy
  // longest-match WordPiece. Capped at MAX_CONTENT_TOKENS ids.
  std::vector<int64_t> tokenize(const std::string &text) const;

  // Encodes every pair as [CLS] a [SEP] b [SEP], truncating b first, then a,
  // so each row fits MAX_SEQUENCE_LENGTH. Rows are padded to the longest row.
  PairBatchEncoding encode_pairs(const std::vector<TextPair> &pairs) const;

  size_t vocab_size() const {
    return vocab_.size();
  }

  static constexpr int64_t PAD_TOKEN_ID = 0;
  static constexpr int MAX_SEQUENCE_LENGTH = 512;
  static constexpr int MAX_CONTENT_TOKENS = MAX_SEQUENCE_LENGTH - 2;
  static constexpr int MAX_PAIR_CONTENT_TOKENS = MAX_SEQUENCE_LENGTH - 3;

 private:
  std::unordered_map<std::string, int64_t> vocab_;
  int64_t unk_id_ = 100;
  int64_t cls_id_ = 101;
  int64_t sep_id_ = 102;

  void resolve_special_tokens();
  std::vector<std::string> basic_split(const std::string &text) const;
  void append_word_pieces(const std::string &word, std::vector<int64_t> &output) const;
};

}  // namespace rentwise_core
