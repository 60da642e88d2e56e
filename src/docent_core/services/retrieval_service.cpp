#include "docent_core/services/retrieval_service.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace docent_core {

RetrievalService::RetrievalService(std::shared_ptr<IndexStore> index_store,
                                   std::shared_ptr<EmbeddingGateway> embedding_gateway)
    : index_store_(std::move(index_store)), embedding_gateway_(std::move(embedding_gateway)) {}

std::vector<RetrievalHit> RetrievalService::search(const std::string &query,
                                                   int k,
                                                   const MetadataFilter &filter) {
  if (k <= 0) {
    throw std::invalid_argument("k must be a positive integer, got " + std::to_string(k));
  }

  std::vector<float> query_vector;
  try {
    query_vector = embedding_gateway_->get_embedding(query);
  } catch (const LlmError &e) {
    std::cerr << "Retrieval: query embedding failed, returning no hits: " << e.what()
              << std::endl;
    return {};
  }

  try {
    return index_store_->search(query_vector, k, filter);
  } catch (const IndexStoreError &e) {
    std::cerr << "Retrieval: index store error (" << to_string(e.kind())
              << "), returning no hits: " << e.what() << std::endl;
    return {};
  }
}

}  // namespace docent_core
