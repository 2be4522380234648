#include "lucid_core/services/compression_service.hpp"

#include <zstd.h>

namespace lucid_core {

std::vector<char> CompressionService::compress(std::string_view data, int compression_level) {
  if (data.empty()) {
    return {};
  }

  std::vector<char> buffer(ZSTD_compressBound(data.size()));
  const size_t written =
      ZSTD_compress(buffer.data(), buffer.size(), data.data(), data.size(), compression_level);
  if (ZSTD_isError(written)) {
    throw CompressionError("zstd compression failed: " + std::string(ZSTD_getErrorName(written)));
  }

  buffer.resize(written);
  return buffer;
}

std::string CompressionService::decompress(const std::vector<char>& compressed_data) {
  if (compressed_data.empty()) {
    return "";
  }

  const unsigned long long expected =
      ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());
  if (expected == ZSTD_CONTENTSIZE_ERROR || expected == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw CompressionError("Stored chunk content is not a sized zstd frame.");
  }

  std::string text(expected, '\0');
  const size_t restored =
      ZSTD_decompress(text.data(), text.size(), compressed_data.data(), compressed_data.size());
  if (ZSTD_isError(restored)) {
    throw CompressionError("zstd decompression failed: " +
                           std::string(ZSTD_getErrorName(restored)));
  }
  if (restored != expected) {
    throw CompressionError("zstd decompression produced " + std::to_string(restored) +
                           " bytes, expected " + std::to_string(expected));
  }
  return text;
}

}  // namespace lucid_core
