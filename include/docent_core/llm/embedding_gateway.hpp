#pragma once

#include <string>
#include <vector>

#include "docent_core/llm/llm_error.hpp"

namespace docent_core {

// Text to fixed-length vector. Implementations throw LlmError when the
// capability is unreachable or returns something unusable.
class EmbeddingGateway {
 public:
  virtual ~EmbeddingGateway() = default;

  virtual std::vector<float> get_embedding(const std::string &text) = 0;

  // One vector per input, in input order
  virtual std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts) {
    std::vector<std::vector<float>> embeddings;
    embeddings.reserve(texts.size());
    for (const auto &text : texts) {
      embeddings.push_back(get_embedding(text));
    }
    return embeddings;
  }
};

}  // namespace docent_core
