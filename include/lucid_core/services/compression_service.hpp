#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace lucid_core {

class CompressionError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Zstandard codec for chunk text kept at rest.
 */
class CompressionService {
 public:
  static constexpr int DEFAULT_LEVEL = 3;

  /**
   * @brief Compresses text into a single zstd frame.
   * @param data The text to compress. Empty input yields an empty buffer.
   * @param compression_level The zstd compression level.
   * @throws CompressionError if zstd reports a failure.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = DEFAULT_LEVEL);

  /**
   * @brief Restores text produced by compress().
   * @throws CompressionError if the buffer is not a complete zstd frame.
   */
  static std::string decompress(const std::vector<char>& compressed_data);
};

}  // namespace lucid_core
