#include "docent_core/services/compression_service.hpp"

#include <zstd.h>

namespace docent_core {

std::vector<char> CompressionService::compress(std::string_view data, int compression_level) {
  if (data.empty()) {
    return {};
  }
  const size_t bound = ZSTD_compressBound(data.size());
  std::vector<char> frame(bound);

  const size_t written =
      ZSTD_compress(frame.data(), frame.size(), data.data(), data.size(), compression_level);
  if (ZSTD_isError(written)) {
    throw CompressionError("ZSTD compression failed: " + std::string(ZSTD_getErrorName(written)));
  }

  frame.resize(written);
  return frame;
}

std::string CompressionService::decompress(const std::vector<char> &compressed_data) {
  if (compressed_data.empty()) {
    return "";
  }

  const unsigned long long expected =
      ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());
  if (expected == ZSTD_CONTENTSIZE_ERROR || expected == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw CompressionError("Stored chunk is not a zstd frame with a known content size.");
  }

  std::string text(static_cast<size_t>(expected), '\0');
  const size_t actual =
      ZSTD_decompress(text.data(), text.size(), compressed_data.data(), compressed_data.size());
  if (ZSTD_isError(actual)) {
    throw CompressionError("ZSTD decompression failed: " + std::string(ZSTD_getErrorName(actual)));
  }
  if (actual != expected) {
    throw CompressionError("ZSTD decompression produced " + std::to_string(actual) +
                           " bytes, frame header announced " + std::to_string(expected));
  }
  return text;
}

}  // namespace docent_core
