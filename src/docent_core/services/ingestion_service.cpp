#include "docent_core/services/ingestion_service.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "docent_core/services/content_hash.hpp"

namespace docent_core {

IngestionService::IngestionService(std::shared_ptr<IndexStore> index_store,
                                   std::shared_ptr<EmbeddingGateway> embedding_gateway,
                                   std::shared_ptr<LoaderRegistry> loader_registry,
                                   IngestionOptions options)
    : index_store_(std::move(index_store)),
      embedding_gateway_(std::move(embedding_gateway)),
      loader_registry_(std::move(loader_registry)),
      chunker_(options.chunker),
      options_(options) {
  if (options_.embedding_batch_size == 0) {
    throw std::invalid_argument("embedding_batch_size must be greater than 0");
  }
}

std::vector<std::vector<float>> IngestionService::embed_chunks(const std::vector<Chunk> &chunks) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(chunks.size());
  for (size_t start = 0; start < chunks.size(); start += options_.embedding_batch_size) {
    const size_t end = std::min(start + options_.embedding_batch_size, chunks.size());
    std::vector<std::string> batch;
    batch.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
      batch.push_back(chunks[i].content);
    }

    std::vector<std::vector<float>> embedded = embedding_gateway_->get_embeddings(batch);
    if (embedded.size() != batch.size()) {
      throw IngestionError(IngestionErrorKind::IndexUnavailable,
                           "Embedding gateway returned " + std::to_string(embedded.size()) +
                               " vectors for " + std::to_string(batch.size()) + " chunks");
    }
    for (auto &vector : embedded) {
      vectors.push_back(std::move(vector));
    }
  }
  return vectors;
}

std::vector<ChunkId> IngestionService::ingest(const std::string &raw_content,
                                              const Metadata &base_metadata) {
  if (!base_metadata.is_null() && !base_metadata.is_object()) {
    throw std::invalid_argument("base_metadata must be a JSON object");
  }

  Metadata merged = {{metadata_keys::TYPE, OFFICIAL_DOCUMENT}};
  if (base_metadata.is_object()) {
    merged.update(base_metadata);
  }
  const std::optional<std::string> source = metadata_string(merged, metadata_keys::SOURCE);
  const std::string label = source.value_or("<inline text>");

  const std::string fingerprint = document_fingerprint(raw_content, merged);

  try {
    if (auto existing = index_store_->find_document_chunks(fingerprint)) {
      std::cout << "Ingestion: " << label << " already indexed as " << existing->size()
                << " chunks" << std::endl;
      return *existing;
    }

    std::vector<Chunk> chunks = chunker_.chunk(raw_content);
    if (chunks.empty()) {
      std::cout << "Ingestion: " << label << " has no text to index" << std::endl;
      return {};
    }

    std::vector<std::vector<float>> vectors = embed_chunks(chunks);
    for (size_t i = 0; i < chunks.size(); ++i) {
      chunks[i].vector_embedding = std::move(vectors[i]);
      chunks[i].metadata = merged;
    }

    std::vector<ChunkId> ids = index_store_->add_document(fingerprint, source, chunks);
    std::cout << "Ingestion: indexed " << ids.size() << " chunks from " << label << std::endl;
    return ids;
  } catch (const LlmError &e) {
    throw IngestionError(IngestionErrorKind::IndexUnavailable,
                         "Embedding failed for " + label + ": " + e.what());
  } catch (const IndexStoreError &e) {
    throw IngestionError(IngestionErrorKind::IndexUnavailable,
                         "Index store rejected " + label + " (" + to_string(e.kind()) +
                             "): " + e.what());
  }
}

std::vector<ChunkId> IngestionService::ingest_file(const std::filesystem::path &file_path,
                                                   const std::string &department,
                                                   const std::string &document_type,
                                                   const Metadata &extra_metadata) {
  const DocumentLoader *loader = nullptr;
  try {
    loader = &loader_registry_->get_loader_for(file_path);
  } catch (const UnsupportedFormatError &e) {
    throw IngestionError(IngestionErrorKind::UnsupportedFormat, e.what());
  }

  if (!std::filesystem::exists(file_path)) {
    throw IngestionError(IngestionErrorKind::LoadFailed, "File not found: " + file_path.string());
  }

  std::string text;
  try {
    text = loader->load(file_path);
  } catch (const LoaderError &e) {
    throw IngestionError(IngestionErrorKind::LoadFailed, e.what());
  }

  Metadata metadata = {{metadata_keys::TYPE, OFFICIAL_DOCUMENT},
                       {metadata_keys::DOCUMENT_TYPE, document_type},
                       {metadata_keys::DEPARTMENT, department},
                       {metadata_keys::SOURCE, file_path.string()},
                       {metadata_keys::FILENAME, file_path.filename().string()}};
  if (extra_metadata.is_object()) {
    metadata.update(extra_metadata);
  }

  std::cout << "Ingestion: loaded " << file_path.filename() << " with the " << loader->name()
            << " loader (" << text.size() << " bytes)" << std::endl;
  return ingest(text, metadata);
}

size_t IngestionService::delete_chunks(const std::vector<ChunkId> &ids) {
  try {
    return index_store_->delete_chunks(ids);
  } catch (const IndexStoreError &e) {
    throw IngestionError(IngestionErrorKind::IndexUnavailable, e.what());
  }
}

size_t IngestionService::delete_document(const std::string &source) {
  try {
    return index_store_->delete_document(source);
  } catch (const IndexStoreError &e) {
    throw IngestionError(IngestionErrorKind::IndexUnavailable, e.what());
  }
}

}  // namespace docent_core
