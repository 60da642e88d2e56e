#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docent_core/db/index_store.hpp"
#include "docent_core/llm/embedding_gateway.hpp"
#include "docent_core/types/metadata.hpp"

namespace docent_core {

using RetrievalHit = ScoredChunk;

class RetrievalService {
 public:
  RetrievalService(std::shared_ptr<IndexStore> index_store,
                   std::shared_ptr<EmbeddingGateway> embedding_gateway);

  virtual ~RetrievalService() = default;

  // Natural-language similarity search restricted to chunks matching every
  // filter entry. At most k hits, best first. An unreachable gateway or store
  // yields an empty list; k must be positive.
  virtual std::vector<RetrievalHit> search(const std::string &query,
                                           int k,
                                           const MetadataFilter &filter = {});

 private:
  std::shared_ptr<IndexStore> index_store_;
  std::shared_ptr<EmbeddingGateway> embedding_gateway_;
};

}  // namespace docent_core
