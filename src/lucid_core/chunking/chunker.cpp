#include "lucid_core/chunking/chunker.hpp"

#include <utf8.h>

#include <algorithm>
#include <iterator>

namespace lucid_core {

Chunker::Chunker(int chunk_size, int chunk_overlap) {
  if (chunk_size <= 0) {
    chunk_size = DEFAULT_CHUNK_SIZE;
  }
  if (chunk_overlap < 0) {
    chunk_overlap = 0;
  }
  if (chunk_overlap >= chunk_size) {
    chunk_overlap = chunk_size / 4;
  }
  chunk_size_ = chunk_size;
  chunk_overlap_ = chunk_overlap;
}

bool Chunker::is_unicode_space(uint32_t code_point) {
  switch (code_point) {
    case 0x09:  // \t
    case 0x0A:  // \n
    case 0x0B:  // \v
    case 0x0C:  // \f
    case 0x0D:  // \r
    case 0x20:
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
      return true;
    default:
      return code_point >= 0x2000 && code_point <= 0x200A;
  }
}

std::vector<std::string> Chunker::tokenize(const std::string& text) {
  std::string valid;
  valid.reserve(text.size());
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(valid));

  std::vector<std::string> words;
  auto it = valid.begin();
  const auto end = valid.end();
  auto word_start = end;
  bool in_word = false;

  while (it != end) {
    auto code_point_start = it;
    uint32_t code_point = utf8::next(it, end);
    if (is_unicode_space(code_point)) {
      if (in_word) {
        words.emplace_back(word_start, code_point_start);
        in_word = false;
      }
    } else if (!in_word) {
      word_start = code_point_start;
      in_word = true;
    }
  }
  if (in_word) {
    words.emplace_back(word_start, end);
  }
  return words;
}

std::vector<std::string> Chunker::chunk(const std::string& text) const {
  const std::vector<std::string> words = tokenize(text);
  std::vector<std::string> chunks;
  if (words.empty()) {
    return chunks;
  }

  const size_t size = static_cast<size_t>(chunk_size_);
  const size_t step = static_cast<size_t>(std::max(1, chunk_size_ - chunk_overlap_));

  for (size_t i = 0; i < words.size(); i += step) {
    const size_t end = std::min(i + size, words.size());

    std::string joined;
    for (size_t w = i; w < end; ++w) {
      if (w != i) {
        joined.push_back(' ');
      }
      joined += words[w];
    }
    chunks.push_back(std::move(joined));

    if (end == words.size()) {
      break;
    }
  }
  return chunks;
}

std::vector<ChunkWithPosition> Chunker::chunk_with_positions(const std::string& text) const {
  std::vector<std::string> chunks = chunk(text);
  std::vector<ChunkWithPosition> positioned;
  positioned.reserve(chunks.size());
  for (size_t i = 0; i < chunks.size(); ++i) {
    positioned.push_back({.content = std::move(chunks[i]), .index = static_cast<int>(i)});
  }
  return positioned;
}

}  // namespace lucid_core
