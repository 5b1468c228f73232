#include "rentwise_core/ranking/wordpiece_tokenizer.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace rentwise_core {

namespace {

constexpr size_t MAX_WORD_CHARS = 100;

bool is_whitespace(char32_t cp) {
  return cp == U' ' || cp == U'\t' || cp == U'\n' || cp == U'\r' || cp == 0x00A0 ||
         cp == 0x3000 || (cp >= 0x2000 && cp <= 0x200A);
}

bool is_control(char32_t cp) {
  return (cp < 0x20 && !is_whitespace(cp)) || cp == 0x7F || cp == 0xFFFD;
}

bool is_punctuation(char32_t cp) {
  if ((cp >= 33 && cp <= 47) || (cp >= 58 && cp <= 64) || (cp >= 91 && cp <= 96) ||
      (cp >= 123 && cp <= 126)) {
    return true;
  }
  return (cp >= 0x2010 && cp <= 0x206F) || (cp >= 0x3001 && cp <= 0x303F) ||
         (cp >= 0xFF01 && cp <= 0xFF0F);
}

// CJK ideographs are emitted as single-character words
bool is_cjk(char32_t cp) {
  return (cp >= 0x4E00 && cp <= 0x9FFF) || (cp >= 0x3400 && cp <= 0x4DBF) ||
         (cp >= 0xF900 && cp <= 0xFAFF) || (cp >= 0x20000 && cp <= 0x2A6DF);
}

// Base letter for U+0100..U+017F after lowercasing and dropping the accent.
// '*' marks letters without a canonical decomposition; those only lowercase.
constexpr char LATIN_EXTENDED_A_BASE[] =
    "aaaaaa" "cccccccc" "dd**" "eeeeeeeeee" "gggggggg" "hh**" "iiiiiiii" "i*" "**" "jj" "kk*"
    "llllll" "****" "nnnnnn" "***" "oooooo" "**" "rrrrrr" "ssssssss" "tttt" "**"
    "uuuuuuuuuuuu" "ww" "yyy" "zzzzzz" "*";
static_assert(sizeof(LATIN_EXTENDED_A_BASE) == 0x80 + 1, "one entry per code point");

char32_t fold_latin_extended_a(char32_t cp) {
  const char base = LATIN_EXTENDED_A_BASE[cp - 0x0100];
  if (base != '*') {
    return static_cast<char32_t>(base);
  }
  // Capitals sit on even code points except in U+0139..U+0148 and U+0179..U+017E
  const bool odd_capitals = (cp >= 0x0139 && cp <= 0x0148) || (cp >= 0x0179 && cp <= 0x017E);
  const bool is_capital = odd_capitals ? (cp % 2 == 1) : (cp % 2 == 0);
  if (is_capital && cp != 0x0138 && cp != 0x0149 && cp != 0x017F) {
    return cp + 1;
  }
  return cp;
}

char32_t fold_latin1(char32_t cp) {
  if (cp >= 0x00C0 && cp <= 0x00DE && cp != 0x00D7) {
    cp += 0x20;
  }
  if (cp >= 0x00E0 && cp <= 0x00E5) return U'a';
  if (cp == 0x00E7) return U'c';
  if (cp >= 0x00E8 && cp <= 0x00EB) return U'e';
  if (cp >= 0x00EC && cp <= 0x00EF) return U'i';
  if (cp == 0x00F1) return U'n';
  if (cp >= 0x00F2 && cp <= 0x00F6) return U'o';
  if (cp >= 0x00F9 && cp <= 0x00FC) return U'u';
  if (cp == 0x00FD || cp == 0x00FF) return U'y';
  return cp;
}

// Uncased BERT normalization: lowercase, then strip accents. Precomposed
// Latin letters map to their base letter and combining marks (U+0300..U+036F)
// are dropped. Greek and Cyrillic capitals are lowercased only; other scripts
// pass through unchanged.
char32_t fold_code_point(char32_t cp) {
  if (cp < 0x80) {
    return static_cast<char32_t>(std::tolower(static_cast<int>(cp)));
  }
  if (cp >= 0x00C0 && cp <= 0x00FF) {
    return fold_latin1(cp);
  }
  if (cp >= 0x0100 && cp <= 0x017F) {
    return fold_latin_extended_a(cp);
  }
  if ((cp >= 0x0391 && cp <= 0x03A9 && cp != 0x03A2) || (cp >= 0x0410 && cp <= 0x042F)) {
    return cp + 0x20;
  }
  if (cp >= 0x0400 && cp <= 0x040F) {
    return cp + 0x50;
  }
  return cp;
}

bool is_combining_mark(char32_t cp) {
  return cp >= 0x0300 && cp <= 0x036F;
}

std::string encode_code_points(const std::u32string &cps, size_t begin, size_t end) {
  std::string out;
  for (size_t i = begin; i < end; ++i) {
    utf8::append(static_cast<uint32_t>(cps[i]), std::back_inserter(out));
  }
  return out;
}

}  // namespace

WordPieceTokenizer::WordPieceTokenizer(const std::filesystem::path &vocab_path) {
  std::ifstream file_stream(vocab_path);
  if (!file_stream.is_open()) {
    throw std::runtime_error("Could not open vocab file: " + vocab_path.string());
  }

  std::string line;
  int64_t index = 0;
  while (std::getline(file_stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (!line.empty()) {
      vocab_.emplace(line, index);
    }
    ++index;
  }

  if (vocab_.empty()) {
    throw std::runtime_error("Vocab file is empty: " + vocab_path.string());
  }
  resolve_special_tokens();
}

WordPieceTokenizer::WordPieceTokenizer(const std::vector<std::string> &vocab) {
  for (size_t i = 0; i < vocab.size(); ++i) {
    vocab_.emplace(vocab[i], static_cast<int64_t>(i));
  }
  if (vocab_.empty()) {
    throw std::runtime_error("Vocab is empty");
  }
  resolve_special_tokens();
}

void WordPieceTokenizer::resolve_special_tokens() {
  auto lookup = [this](const char *token, int64_t fallback) {
    auto it = vocab_.find(token);
    return it != vocab_.end() ? it->second : fallback;
  };
  unk_id_ = lookup("[UNK]", unk_id_);
  cls_id_ = lookup("[CLS]", cls_id_);
  sep_id_ = lookup("[SEP]", sep_id_);
}

std::vector<std::string> WordPieceTokenizer::basic_split(const std::string &text) const {
  std::string valid;
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(valid));

  std::vector<std::string> words;
  std::string current;
  auto flush = [&]() {
    if (!current.empty()) {
      words.push_back(std::move(current));
      current.clear();
    }
  };

  for (auto it = valid.begin(); it != valid.end();) {
    const char32_t cp = fold_code_point(utf8::next(it, valid.end()));

    if (is_combining_mark(cp)) {
      continue;
    } else if (is_whitespace(cp)) {
      flush();
    } else if (is_control(cp)) {
      continue;
    } else if (is_punctuation(cp) || is_cjk(cp)) {
      flush();
      utf8::append(static_cast<uint32_t>(cp), std::back_inserter(current));
      flush();
    } else {
      utf8::append(static_cast<uint32_t>(cp), std::back_inserter(current));
    }
  }
  flush();
  return words;
}

void WordPieceTokenizer::append_word_pieces(const std::string &word,
                                            std::vector<int64_t> &output) const {
  std::u32string cps;
  utf8::utf8to32(word.begin(), word.end(), std::back_inserter(cps));
  if (cps.size() > MAX_WORD_CHARS) {
    output.push_back(unk_id_);
    return;
  }

  std::vector<int64_t> pieces;
  size_t start = 0;
  while (start < cps.size()) {
    size_t end = cps.size();
    int64_t matched = -1;
    while (end > start) {
      std::string piece = encode_code_points(cps, start, end);
      if (start > 0) {
        piece = "##" + piece;
      }
      auto it = vocab_.find(piece);
      if (it != vocab_.end()) {
        matched = it->second;
        break;
      }
      --end;
    }
    if (matched < 0) {
      // No decomposition: the whole word becomes [UNK]
      output.push_back(unk_id_);
      return;
    }
    pieces.push_back(matched);
    start = end;
  }
  output.insert(output.end(), pieces.begin(), pieces.end());
}

std::vector<int64_t> WordPieceTokenizer::tokenize(const std::string &text) const {
  std::vector<int64_t> ids;
  for (const auto &word : basic_split(text)) {
    if (static_cast<int>(ids.size()) >= MAX_CONTENT_TOKENS) {
      break;
    }
    append_word_pieces(word, ids);
  }
  if (static_cast<int>(ids.size()) > MAX_CONTENT_TOKENS) {
    ids.resize(MAX_CONTENT_TOKENS);
  }
  return ids;
}

WordPieceTokenizer::PairBatchEncoding WordPieceTokenizer::encode_pairs(
    const std::vector<TextPair> &pairs) const {
  PairBatchEncoding batch;
  if (pairs.empty()) {
    return batch;
  }

  std::vector<std::vector<int64_t>> rows_ids;
  std::vector<std::vector<int64_t>> rows_types;
  rows_ids.reserve(pairs.size());
  rows_types.reserve(pairs.size());
  size_t max_length = 0;

  for (const auto &[text_a, text_b] : pairs) {
    std::vector<int64_t> tokens_a = tokenize(text_a);
    std::vector<int64_t> tokens_b = tokenize(text_b);

    // Longest-first truncation, b loses ties
    while (tokens_a.size() + tokens_b.size() > static_cast<size_t>(MAX_PAIR_CONTENT_TOKENS)) {
      if (tokens_b.size() >= tokens_a.size()) {
        tokens_b.pop_back();
      } else {
        tokens_a.pop_back();
      }
    }

    std::vector<int64_t> ids;
    ids.reserve(tokens_a.size() + tokens_b.size() + 3);
    ids.push_back(cls_id_);
    ids.insert(ids.end(), tokens_a.begin(), tokens_a.end());
    ids.push_back(sep_id_);
    ids.insert(ids.end(), tokens_b.begin(), tokens_b.end());
    ids.push_back(sep_id_);

    std::vector<int64_t> types(tokens_a.size() + 2, 0);
    types.resize(ids.size(), 1);

    max_length = std::max(max_length, ids.size());
    rows_ids.push_back(std::move(ids));
    rows_types.push_back(std::move(types));
  }

  batch.batch_size = static_cast<int>(pairs.size());
  batch.sequence_length = static_cast<int>(max_length);
  const size_t total = pairs.size() * max_length;
  batch.input_ids.reserve(total);
  batch.attention_mask.reserve(total);
  batch.token_type_ids.reserve(total);

  for (size_t row = 0; row < rows_ids.size(); ++row) {
    const size_t length = rows_ids[row].size();
    batch.input_ids.insert(batch.input_ids.end(), rows_ids[row].begin(), rows_ids[row].end());
    batch.input_ids.insert(batch.input_ids.end(), max_length - length, PAD_TOKEN_ID);
    batch.attention_mask.insert(batch.attention_mask.end(), length, 1);
    batch.attention_mask.insert(batch.attention_mask.end(), max_length - length, 0);
    batch.token_type_ids.insert(batch.token_type_ids.end(), rows_types[row].begin(),
                                rows_types[row].end());
    batch.token_type_ids.insert(batch.token_type_ids.end(), max_length - length, 0);
  }

  return batch;
}

}  // namespace rentwise_core
