#include "rentwise_core/text/text_splitter.hpp"

#include <utf8.h>

#include <deque>
#include <iostream>
#include <stdexcept>

#include "rentwise_core/text/text_cleaner.hpp"
#include "rentwise_core/text/utf8_prefix.hpp"

namespace rentwise_core {

namespace {

// Splits into single code points (bytes, where the text is not valid UTF-8)
std::vector<std::string> split_characters(const std::string &text) {
  std::vector<std::string> pieces;
  if (!utf8::is_valid(text.begin(), text.end())) {
    for (char c : text) {
      pieces.emplace_back(1, c);
    }
    return pieces;
  }

  auto it = text.begin();
  while (it != text.end()) {
    auto start = it;
    utf8::next(it, text.end());
    pieces.emplace_back(start, it);
  }
  return pieces;
}

// Each separator stays at the front of the piece after it
std::vector<std::string> split_keep_separator(const std::string &text,
                                              const std::string &separator) {
  if (separator.empty()) {
    return split_characters(text);
  }

  std::vector<std::string> pieces;
  size_t start = 0;
  size_t found = text.find(separator);
  while (found != std::string::npos) {
    if (found > start) {
      pieces.push_back(text.substr(start, found - start));
    }
    start = found;
    found = text.find(separator, start + separator.size());
  }
  if (start < text.size()) {
    pieces.push_back(text.substr(start));
  }
  return pieces;
}

}  // namespace

TextSplitter::TextSplitter(TextSplitterOptions options) : options_(std::move(options)) {
  if (options_.chunk_size == 0) {
    throw std::invalid_argument("chunk_size must be positive");
  }
  if (options_.chunk_overlap >= options_.chunk_size) {
    throw std::invalid_argument("chunk_overlap (" + std::to_string(options_.chunk_overlap) +
                                ") must be smaller than chunk_size (" +
                                std::to_string(options_.chunk_size) + ")");
  }
  if (options_.separators.empty()) {
    options_.separators.push_back("");
  }
}

std::vector<std::string> TextSplitter::split_text(const std::string &text) const {
  return split_recursive(text, options_.separators);
}

std::vector<std::string> TextSplitter::split_recursive(
    const std::string &text, const std::vector<std::string> &separators) const {
  std::string separator = separators.back();
  std::vector<std::string> remaining;
  for (size_t i = 0; i < separators.size(); ++i) {
    if (separators[i].empty()) {
      separator = separators[i];
      break;
    }
    if (text.find(separators[i]) != std::string::npos) {
      separator = separators[i];
      remaining.assign(separators.begin() + i + 1, separators.end());
      break;
    }
  }

  std::vector<std::string> chunks;
  std::vector<std::string> good_splits;
  auto flush_good_splits = [&]() {
    if (!good_splits.empty()) {
      auto merged = merge_splits(good_splits);
      chunks.insert(chunks.end(), merged.begin(), merged.end());
      good_splits.clear();
    }
  };

  for (auto &piece : split_keep_separator(text, separator)) {
    if (utf8_length(piece) < options_.chunk_size) {
      good_splits.push_back(std::move(piece));
      continue;
    }
    flush_good_splits();
    if (remaining.empty()) {
      chunks.push_back(std::move(piece));
    } else {
      auto nested = split_recursive(piece, remaining);
      chunks.insert(chunks.end(), nested.begin(), nested.end());
    }
  }
  flush_good_splits();
  return chunks;
}

std::vector<std::string> TextSplitter::merge_splits(const std::vector<std::string> &splits) const {
  std::vector<std::string> docs;
  std::deque<std::pair<std::string, size_t>> current;  // piece and its length
  size_t total = 0;

  auto emit = [&]() {
    std::string joined;
    for (const auto &entry : current) {
      joined += entry.first;
    }
    joined = trim_whitespace(joined);
    if (!joined.empty()) {
      docs.push_back(std::move(joined));
    }
  };

  for (const auto &piece : splits) {
    const size_t length = utf8_length(piece);
    if (total + length > options_.chunk_size) {
      if (total > options_.chunk_size) {
        std::cerr << "Warning: created a chunk of " << total << " characters, longer than "
                  << options_.chunk_size << std::endl;
      }
      if (!current.empty()) {
        emit();
        while (total > options_.chunk_overlap ||
               (total + length > options_.chunk_size && total > 0)) {
          total -= current.front().second;
          current.pop_front();
        }
      }
    }
    current.emplace_back(piece, length);
    total += length;
  }
  if (!current.empty()) {
    emit();
  }
  return docs;
}

}  // namespace rentwise_core
