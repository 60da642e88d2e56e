#pragma once

#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "docent_core/chunking/text_chunker.hpp"
#include "docent_core/db/index_store.hpp"
#include "docent_core/llm/embedding_gateway.hpp"
#include "docent_core/loaders/loader_registry.hpp"
#include "docent_core/types/chunk.hpp"
#include "docent_core/types/metadata.hpp"

namespace docent_core {

enum class IngestionErrorKind { UnsupportedFormat, LoadFailed, IndexUnavailable };

inline std::string to_string(IngestionErrorKind kind) {
  switch (kind) {
    case IngestionErrorKind::UnsupportedFormat:
      return "UnsupportedFormat";
    case IngestionErrorKind::LoadFailed:
      return "LoadFailed";
    case IngestionErrorKind::IndexUnavailable:
      return "IndexUnavailable";
    default:
      return "Unknown";
  }
}

class IngestionError : public std::exception {
 public:
  IngestionError(IngestionErrorKind kind, const std::string &message)
      : kind_(kind), message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }
  IngestionErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  IngestionErrorKind kind_;
  std::string message_;
};

struct IngestionOptions {
  ChunkerOptions chunker;
  // Texts per embedding request
  size_t embedding_batch_size = 64;
};

class IngestionService {
 public:
  IngestionService(std::shared_ptr<IndexStore> index_store,
                   std::shared_ptr<EmbeddingGateway> embedding_gateway,
                   std::shared_ptr<LoaderRegistry> loader_registry,
                   IngestionOptions options = {});

  virtual ~IngestionService() = default;

  // Chunks, embeds and stores raw text. Every chunk carries base_metadata on
  // top of the defaults ({"type": "official_document"}); caller fields win.
  // Ingesting the same text with the same metadata again returns the ids of
  // the first ingestion. Throws IngestionError(IndexUnavailable) when the
  // gateway or the store fails; nothing is stored in that case.
  virtual std::vector<ChunkId> ingest(const std::string &raw_content,
                                      const Metadata &base_metadata);

  // Loads a .pdf, .txt, .doc or .docx file and ingests it as an official
  // document. "filename" defaults to the file's basename and "source" to its
  // path; extra_metadata overrides both.
  std::vector<ChunkId> ingest_file(const std::filesystem::path &file_path,
                                   const std::string &department,
                                   const std::string &document_type,
                                   const Metadata &extra_metadata = Metadata::object());

  size_t delete_chunks(const std::vector<ChunkId> &ids);
  size_t delete_document(const std::string &source);

  const LoaderRegistry &loader_registry() const {
    return *loader_registry_;
  }

 private:
  std::vector<std::vector<float>> embed_chunks(const std::vector<Chunk> &chunks);

  std::shared_ptr<IndexStore> index_store_;
  std::shared_ptr<EmbeddingGateway> embedding_gateway_;
  std::shared_ptr<LoaderRegistry> loader_registry_;
  TextChunker chunker_;
  IngestionOptions options_;
};

}  // namespace docent_core
