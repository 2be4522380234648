#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "lucid_core/types/chunk.hpp"

namespace lucid_core {

/**
 * @brief Splits text into overlapping, word-based chunks for embedding.
 *
 * Words are runs of non-whitespace Unicode code points. Each chunk holds up to
 * chunk_size words joined by single spaces; consecutive chunks share
 * chunk_overlap words. The output depends only on the input and the
 * configuration.
 */
class Chunker {
 public:
  static constexpr int DEFAULT_CHUNK_SIZE = 512;

  /**
   * @param chunk_size Words per chunk. Values <= 0 select DEFAULT_CHUNK_SIZE.
   * @param chunk_overlap Words shared by neighbouring chunks. Negative values
   *        become 0; values >= chunk_size are clamped to chunk_size / 4.
   */
  Chunker(int chunk_size, int chunk_overlap);
  virtual ~Chunker() = default;

  int chunk_size() const {
    return chunk_size_;
  }
  int chunk_overlap() const {
    return chunk_overlap_;
  }

  // Empty and whitespace-only input produce no chunks.
  virtual std::vector<std::string> chunk(const std::string& text) const;

  std::vector<ChunkWithPosition> chunk_with_positions(const std::string& text) const;

  // Splits on Unicode whitespace. Invalid UTF-8 is replaced with U+FFFD first.
  static std::vector<std::string> tokenize(const std::string& text);

  static bool is_unicode_space(uint32_t code_point);

 private:
  int chunk_size_;
  int chunk_overlap_;
};

}  // namespace lucid_core
