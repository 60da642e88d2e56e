#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "docent_core/types/chunk.hpp"

namespace docent_core {

struct ChunkerOptions {
  size_t chunk_size = 1000;
  size_t chunk_overlap = 100;
};

// Splits text into overlapping windows of at most chunk_size bytes.
//
// Each window ends at the last paragraph break, line break, sentence end or
// blank found in its second half, in that order of preference; when none
// exists it is cut hard at chunk_size on a code point boundary. The next
// window starts chunk_overlap bytes before the cut, moved forward to the next
// word start. Windows are trimmed and whitespace-only windows are dropped.
// The output depends only on the text and the options.
class TextChunker {
 public:
  explicit TextChunker(ChunkerOptions options = {});

  std::vector<Chunk> chunk(const std::string &text) const;

  const ChunkerOptions &options() const {
    return options_;
  }

 private:
  size_t find_break(const std::string &text, size_t pos, size_t window_end) const;
  static size_t align_to_code_point(const std::string &text, size_t index);
  static std::string trim(const std::string &text);

  ChunkerOptions options_;
};

}  // namespace docent_core
