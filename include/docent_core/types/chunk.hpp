#pragma once

#include <string>
#include <vector>

#include "docent_core/types/metadata.hpp"

namespace docent_core {

using ChunkId = long long;

struct Chunk {
  std::string content;
  int chunk_index = 0;
  std::vector<float> vector_embedding;
  Metadata metadata = Metadata::object();
};

// A chunk as read back from the index.
struct StoredChunk {
  ChunkId id = 0;
  long long document_id = 0;
  int chunk_index = 0;
  std::string content;
  Metadata metadata = Metadata::object();
};

}  // namespace docent_core
