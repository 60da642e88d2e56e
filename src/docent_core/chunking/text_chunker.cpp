#include "docent_core/chunking/text_chunker.hpp"

#include <utf8.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace docent_core {

namespace {

bool is_blank(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_sentence_end(char c) {
  return c == '.' || c == '!' || c == '?';
}

bool is_continuation_byte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

}  // namespace

TextChunker::TextChunker(ChunkerOptions options) : options_(options) {
  if (options_.chunk_size == 0) {
    throw std::invalid_argument("chunk_size must be greater than 0");
  }
  if (options_.chunk_overlap >= options_.chunk_size) {
    throw std::invalid_argument("chunk_overlap must be smaller than chunk_size");
  }
}

size_t TextChunker::align_to_code_point(const std::string &text, size_t index) {
  while (index > 0 && index < text.size() && is_continuation_byte(text[index])) {
    --index;
  }
  return index;
}

std::string TextChunker::trim(const std::string &text) {
  const auto first = std::find_if_not(text.begin(), text.end(), is_blank);
  const auto last = std::find_if_not(text.rbegin(), text.rend(), is_blank).base();
  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

// Returns the end of the window at a natural boundary, or npos.
size_t TextChunker::find_break(const std::string &text, size_t pos, size_t window_end) const {
  // Breaks in the first half would make tiny chunks and barely advance
  const size_t min_cut = pos + std::max(options_.chunk_overlap, options_.chunk_size / 2) + 1;
  if (min_cut > window_end) {
    return std::string::npos;
  }

  // Paragraph
  if (window_end - pos >= 2) {
    const size_t idx = text.rfind("\n\n", window_end - 2);
    if (idx != std::string::npos && idx >= pos && idx + 2 >= min_cut) {
      return idx + 2;
    }
  }

  // Line
  {
    const size_t idx = text.rfind('\n', window_end - 1);
    if (idx != std::string::npos && idx >= pos && idx + 1 >= min_cut) {
      return idx + 1;
    }
  }

  // Sentence: terminal punctuation followed by a blank, both inside the window
  for (size_t i = window_end - 1; i > pos && i >= min_cut; --i) {
    if (is_blank(text[i]) && is_sentence_end(text[i - 1])) {
      return i + 1;
    }
  }

  // Word
  for (size_t i = window_end - 1; i >= min_cut - 1 && i >= pos; --i) {
    if (is_blank(text[i])) {
      return i + 1;
    }
    if (i == 0) {
      break;
    }
  }

  return std::string::npos;
}

std::vector<Chunk> TextChunker::chunk(const std::string &raw_text) const {
  std::string text;
  text.reserve(raw_text.size());
  utf8::replace_invalid(raw_text.begin(), raw_text.end(), std::back_inserter(text));

  std::vector<Chunk> chunks;
  const size_t n = text.size();
  size_t pos = 0;
  int chunk_index = 0;

  while (pos < n) {
    const size_t window_end = std::min(pos + options_.chunk_size, n);

    size_t cut = window_end;
    if (window_end < n) {
      cut = find_break(text, pos, window_end);
      if (cut == std::string::npos) {
        cut = align_to_code_point(text, window_end);
        if (cut <= pos) {
          // Window narrower than one code point: take the whole code point
          cut = window_end;
          while (cut < n && is_continuation_byte(text[cut])) {
            ++cut;
          }
        }
      }
    }

    std::string piece = trim(text.substr(pos, cut - pos));
    if (!piece.empty()) {
      chunks.push_back({.content = std::move(piece), .chunk_index = chunk_index++});
    }
    if (cut >= n) {
      break;
    }

    // Step back by the overlap, then forward to the start of a word
    size_t next = cut > options_.chunk_overlap ? cut - options_.chunk_overlap : 0;
    next = std::max(next, pos + 1);
    if (options_.chunk_overlap > 0 && !is_blank(text[next - 1])) {
      for (size_t i = next; i < cut; ++i) {
        if (is_blank(text[i])) {
          next = i + 1;
          break;
        }
      }
    }
    while (next < n && is_continuation_byte(text[next])) {
      ++next;
    }
    pos = next;
  }

  return chunks;
}

}  // namespace docent_core
