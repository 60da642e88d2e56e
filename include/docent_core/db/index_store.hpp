#pragma once
#include <sqlite_modern_cpp.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docent_core/db/database_manager.hpp"
#include "docent_core/types/chunk.hpp"
#include "docent_core/types/metadata.hpp"

namespace docent_core {

enum class IndexStoreErrorKind { Unavailable, DimensionMismatch, Storage };

inline std::string to_string(IndexStoreErrorKind kind) {
  switch (kind) {
    case IndexStoreErrorKind::Unavailable:
      return "unavailable";
    case IndexStoreErrorKind::DimensionMismatch:
      return "dimension_mismatch";
    case IndexStoreErrorKind::Storage:
      return "storage";
    default:
      return "unknown";
  }
}

class IndexStoreError : public std::exception {
 public:
  IndexStoreError(IndexStoreErrorKind kind, const std::string &message)
      : kind_(kind), message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }
  IndexStoreErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  IndexStoreErrorKind kind_;
  std::string message_;
};

struct ScoredChunk {
  StoredChunk chunk;
  // Cosine similarity to the query, higher is closer
  float score = 0.0f;
};

// Persistent store of embedded chunks. Chunks are grouped under a document
// row keyed by the content hash of the ingestion request; chunk ids are
// assigned by the database and never reused. The store shares ownership of
// its database manager.
class IndexStore {
 public:
  IndexStore(std::shared_ptr<DatabaseManager> db_manager, int dimension);

  IndexStore(const IndexStore &) = delete;
  IndexStore &operator=(const IndexStore &) = delete;

  int dimension() const {
    return dimension_;
  }

  // Chunk ids of a previously added document, in chunk order. A document
  // that lost some of its chunks to delete_chunks counts as absent.
  std::optional<std::vector<ChunkId>> find_document_chunks(const std::string &content_hash);

  // Adds all chunks of one document in a single transaction: either every
  // chunk becomes retrievable or none does. When the hash is already present
  // the existing ids are returned and nothing is written, unless some of its
  // chunks were deleted; then the old document is replaced as a whole.
  std::vector<ChunkId> add_document(const std::string &content_hash,
                                    const std::optional<std::string> &source,
                                    const std::vector<Chunk> &chunks);

  // Top-k chunks by cosine similarity among those whose metadata matches
  // every filter entry. Equal scores are ordered by ascending chunk id.
  std::vector<ScoredChunk> search(const std::vector<float> &query_vector,
                                  int k,
                                  const MetadataFilter &filter = {});

  // Chunks in the order requested. Unknown ids are skipped.
  std::vector<StoredChunk> get_chunks(const std::vector<ChunkId> &ids);

  size_t count_chunks(const MetadataFilter &filter = {});

  // Returns the number of chunks removed. Documents left without chunks are
  // removed too, so re-ingesting them is possible.
  size_t delete_chunks(const std::vector<ChunkId> &ids);
  size_t delete_document(const std::string &source);

 private:
  struct FilterClause {
    std::string sql;
    std::vector<std::string> params;
  };
  struct StoredDocument {
    long long id = 0;
    size_t chunk_count = 0;
    std::vector<ChunkId> chunk_ids;

    bool complete() const {
      return chunk_ids.size() == chunk_count;
    }
  };
  static FilterClause build_filter_clause(const MetadataFilter &filter);
  static std::string id_vector_to_comma_string(const std::vector<ChunkId> &ids);
  static std::string current_timestamp();
  static std::optional<std::string> column_value(const Metadata &metadata, const char *key);

  void validate_dimension(const std::vector<float> &vector, const std::string &what) const;
  void remove_orphan_documents(sqlite::database &db);
  static std::optional<StoredDocument> lookup_document(sqlite::database &db,
                                                       const std::string &content_hash);

  template <typename Fn>
  auto guarded(const std::string &operation, Fn &&fn) -> decltype(fn());

  std::shared_ptr<DatabaseManager> db_manager_;
  int dimension_;
};

}  // namespace docent_core
