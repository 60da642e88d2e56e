#include "docent_core/db/index_store.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "docent_core/db/pooled_connection.hpp"
#include "docent_core/db/sqlite_error_utils.hpp"
#include "docent_core/db/transaction.hpp"
#include "docent_core/services/compression_service.hpp"

namespace docent_core {

namespace {

// Metadata keys that are mirrored into dedicated, indexed columns.
const char *const FILTER_COLUMNS[] = {metadata_keys::TYPE, metadata_keys::DOCUMENT_TYPE,
                                      metadata_keys::DEPARTMENT, metadata_keys::USER_ID};

bool is_filter_column(const std::string &key) {
  for (const char *column : FILTER_COLUMNS) {
    if (key == column) {
      return true;
    }
  }
  return false;
}

std::string json_path_for(const std::string &key) {
  std::string path = "$.\"";
  for (char c : key) {
    if (c == '"' || c == '\\') {
      path.push_back('\\');
    }
    path.push_back(c);
  }
  path.push_back('"');
  return path;
}

}  // namespace

IndexStore::IndexStore(std::shared_ptr<DatabaseManager> db_manager, int dimension)
    : db_manager_(std::move(db_manager)), dimension_(dimension) {
  if (!db_manager_) {
    throw std::invalid_argument("IndexStore requires a database manager");
  }
  if (dimension_ <= 0) {
    throw std::invalid_argument("IndexStore dimension must be greater than 0");
  }
}

template <typename Fn>
auto IndexStore::guarded(const std::string &operation, Fn &&fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const DatabaseUnavailableError &e) {
    throw IndexStoreError(IndexStoreErrorKind::Unavailable, operation + ": " + e.what());
  } catch (const sqlite::sqlite_exception &e) {
    const DbErrorKind kind = classify_sqlite_code(e.get_code());
    throw IndexStoreError(is_availability_error(kind) ? IndexStoreErrorKind::Unavailable
                                                      : IndexStoreErrorKind::Storage,
                          format_db_error(operation, e));
  } catch (const CompressionError &e) {
    throw IndexStoreError(IndexStoreErrorKind::Storage, operation + ": " + e.what());
  }
}

std::string IndexStore::current_timestamp() {
  auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::stringstream ss;
  ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::string IndexStore::id_vector_to_comma_string(const std::vector<ChunkId> &ids) {
  std::stringstream ss;
  for (size_t i = 0; i < ids.size(); ++i) {
    ss << ids[i];
    if (i < ids.size() - 1)
      ss << ",";
  }
  return ss.str();
}

std::optional<std::string> IndexStore::column_value(const Metadata &metadata, const char *key) {
  if (!metadata.is_object()) {
    return std::nullopt;
  }
  auto it = metadata.find(key);
  if (it == metadata.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

IndexStore::FilterClause IndexStore::build_filter_clause(const MetadataFilter &filter) {
  FilterClause clause;
  for (const auto &[key, value] : filter) {
    clause.sql += " AND ";
    if (is_filter_column(key)) {
      clause.sql += key + " = ?";
    } else {
      clause.sql += "json_extract(metadata, ?) = ?";
      clause.params.push_back(json_path_for(key));
    }
    clause.params.push_back(value);
  }
  return clause;
}

void IndexStore::validate_dimension(const std::vector<float> &vector,
                                    const std::string &what) const {
  if (vector.size() != static_cast<size_t>(dimension_)) {
    throw IndexStoreError(IndexStoreErrorKind::DimensionMismatch,
                          "Vector embedding size mismatch for " + what + ". Expected " +
                              std::to_string(dimension_) + " dimensions, got " +
                              std::to_string(vector.size()) + ".");
  }
}

std::optional<IndexStore::StoredDocument> IndexStore::lookup_document(
    sqlite::database &db, const std::string &content_hash) {
  std::optional<StoredDocument> document;
  db << "SELECT id, chunk_count FROM documents WHERE content_hash = ?" << content_hash >>
      [&](long long id, long long chunk_count) {
        document = StoredDocument{};
        document->id = id;
        document->chunk_count = static_cast<size_t>(chunk_count);
      };
  if (document) {
    db << "SELECT id FROM chunks WHERE document_id = ? ORDER BY chunk_index" << document->id >>
        [&](long long id) { document->chunk_ids.push_back(id); };
  }
  return document;
}

std::optional<std::vector<ChunkId>> IndexStore::find_document_chunks(
    const std::string &content_hash) {
  return guarded("find_document_chunks", [&]() -> std::optional<std::vector<ChunkId>> {
    PooledConnection conn(*db_manager_);
    auto document = lookup_document(*conn, content_hash);
    if (!document || !document->complete()) {
      return std::nullopt;
    }
    return document->chunk_ids;
  });
}

std::vector<ChunkId> IndexStore::add_document(const std::string &content_hash,
                                              const std::optional<std::string> &source,
                                              const std::vector<Chunk> &chunks) {
  // Reject the whole document before any write if one vector is malformed
  for (const auto &chunk : chunks) {
    validate_dimension(chunk.vector_embedding, "chunk " + std::to_string(chunk.chunk_index));
  }

  return guarded("add_document", [&]() {
    PooledConnection conn(*db_manager_);
    Transaction tx(*conn, /*immediate*/ true);

    auto existing = lookup_document(*conn, content_hash);
    if (existing && existing->complete()) {
      tx.commit();
      return existing->chunk_ids;
    }
    if (existing) {
      // Some chunks were deleted since; the survivors go with the old row
      std::cout << "IndexStore: replacing partly deleted document " << existing->id << " ("
                << existing->chunk_ids.size() << " of " << existing->chunk_count
                << " chunks left)" << std::endl;
      *conn << "DELETE FROM documents WHERE id = ?" << existing->id;
    }

    const auto chunk_count = static_cast<long long>(chunks.size());
    if (source) {
      *conn << "INSERT INTO documents (content_hash, source, chunk_count, created_at) "
               "VALUES (?, ?, ?, ?)"
            << content_hash << *source << chunk_count << current_timestamp();
    } else {
      *conn << "INSERT INTO documents (content_hash, source, chunk_count, created_at) "
               "VALUES (?, NULL, ?, ?)"
            << content_hash << chunk_count << current_timestamp();
    }
    const long long document_id = conn->last_insert_rowid();

    std::vector<ChunkId> ids;
    ids.reserve(chunks.size());
    for (const auto &chunk : chunks) {
      std::vector<char> vector_blob(chunk.vector_embedding.size() * sizeof(float));
      std::memcpy(vector_blob.data(), chunk.vector_embedding.data(), vector_blob.size());
      const std::vector<char> compressed = CompressionService::compress(chunk.content);

      const Metadata &metadata = chunk.metadata;
      *conn << "INSERT INTO chunks (document_id, chunk_index, content, vector_blob, metadata, "
               "type, document_type, department, user_id) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)"
            << document_id << chunk.chunk_index << compressed << vector_blob << metadata.dump()
            << column_value(metadata, metadata_keys::TYPE)
            << column_value(metadata, metadata_keys::DOCUMENT_TYPE)
            << column_value(metadata, metadata_keys::DEPARTMENT)
            << column_value(metadata, metadata_keys::USER_ID);
      ids.push_back(conn->last_insert_rowid());
    }

    tx.commit();
    return ids;
  });
}

std::vector<ScoredChunk> IndexStore::search(const std::vector<float> &query_vector,
                                            int k,
                                            const MetadataFilter &filter) {
  if (k <= 0) {
    return {};
  }
  validate_dimension(query_vector, "query");

  // Load candidate vectors first so the connection is not held during the search
  std::vector<faiss::idx_t> faiss_ids;
  std::vector<float> all_vectors_flat;
  const size_t vector_bytes = static_cast<size_t>(dimension_) * sizeof(float);
  guarded("search", [&]() {
    PooledConnection conn(*db_manager_);
    const FilterClause clause = build_filter_clause(filter);
    auto statement =
        *conn << "SELECT id, vector_blob FROM chunks WHERE 1 = 1" + clause.sql + " ORDER BY id";
    for (const auto &param : clause.params) {
      statement << param;
    }
    statement >> [&](long long id, std::vector<char> vector_blob) {
      if (vector_blob.size() == vector_bytes) {
        faiss_ids.push_back(id);
        const float *vec_ptr = reinterpret_cast<const float *>(vector_blob.data());
        all_vectors_flat.insert(all_vectors_flat.end(), vec_ptr, vec_ptr + dimension_);
      } else {
        std::cerr << "Warning: Skipping chunk ID " << id
                  << " during search due to mismatched vector dimension. Expected "
                  << vector_bytes << " bytes, got " << vector_blob.size() << " bytes."
                  << std::endl;
      }
    };
  });

  const auto candidate_count = static_cast<faiss::idx_t>(faiss_ids.size());
  if (candidate_count == 0) {
    return {};
  }

  // Inner product over unit vectors is cosine similarity
  faiss::fvec_renorm_L2(dimension_, faiss_ids.size(), all_vectors_flat.data());
  std::vector<float> query = query_vector;
  faiss::fvec_renorm_L2(dimension_, 1, query.data());

  // Temporary exact index over the filtered candidates only
  faiss::IndexFlatIP flat_index(dimension_);
  faiss::IndexIDMap candidate_index(&flat_index);
  candidate_index.add_with_ids(candidate_count, all_vectors_flat.data(), faiss_ids.data());

  // Rank every candidate so ties can be broken deterministically
  std::vector<float> distances(candidate_count);
  std::vector<faiss::idx_t> labels(candidate_count);
  candidate_index.search(1, query.data(), candidate_count, distances.data(), labels.data());

  std::vector<std::pair<float, ChunkId>> ranked;
  ranked.reserve(candidate_count);
  for (faiss::idx_t i = 0; i < candidate_count; ++i) {
    if (labels[i] >= 0) {
      ranked.emplace_back(distances[i], static_cast<ChunkId>(labels[i]));
    }
  }
  std::sort(ranked.begin(), ranked.end(), [](const auto &a, const auto &b) {
    if (a.first != b.first) {
      return a.first > b.first;
    }
    return a.second < b.second;
  });
  if (ranked.size() > static_cast<size_t>(k)) {
    ranked.resize(k);
  }

  std::vector<ChunkId> top_ids;
  top_ids.reserve(ranked.size());
  for (const auto &entry : ranked) {
    top_ids.push_back(entry.second);
  }
  std::vector<StoredChunk> stored = get_chunks(top_ids);
  std::unordered_map<ChunkId, StoredChunk> by_id;
  for (auto &chunk : stored) {
    by_id.emplace(chunk.id, std::move(chunk));
  }

  std::vector<ScoredChunk> results;
  results.reserve(ranked.size());
  for (const auto &[score, id] : ranked) {
    auto it = by_id.find(id);
    if (it == by_id.end()) {
      // Deleted between the vector scan and the fetch
      continue;
    }
    results.push_back(ScoredChunk{.chunk = std::move(it->second), .score = score});
  }
  return results;
}

std::vector<StoredChunk> IndexStore::get_chunks(const std::vector<ChunkId> &ids) {
  if (ids.empty()) {
    return {};
  }
  return guarded("get_chunks", [&]() {
    std::unordered_map<ChunkId, StoredChunk> id_to_chunk;
    {
      PooledConnection conn(*db_manager_);
      *conn << "SELECT id, document_id, chunk_index, content, metadata FROM chunks WHERE id IN (" +
                   id_vector_to_comma_string(ids) + ")" >>
          [&](long long id, long long document_id, int chunk_index, std::vector<char> content,
              std::string metadata) {
            StoredChunk chunk;
            chunk.id = id;
            chunk.document_id = document_id;
            chunk.chunk_index = chunk_index;
            chunk.content = CompressionService::decompress(content);
            chunk.metadata = Metadata::parse(metadata, nullptr, /*allow_exceptions*/ false);
            if (chunk.metadata.is_discarded()) {
              std::cerr << "Warning: chunk " << id << " has unreadable metadata" << std::endl;
              chunk.metadata = Metadata::object();
            }
            id_to_chunk[id] = std::move(chunk);
          };
    }

    std::vector<StoredChunk> chunks;
    chunks.reserve(ids.size());
    for (ChunkId id : ids) {
      auto it = id_to_chunk.find(id);
      if (it != id_to_chunk.end()) {
        chunks.push_back(it->second);
      }
    }
    return chunks;
  });
}

size_t IndexStore::count_chunks(const MetadataFilter &filter) {
  return guarded("count_chunks", [&]() {
    PooledConnection conn(*db_manager_);
    const FilterClause clause = build_filter_clause(filter);
    auto statement = *conn << "SELECT COUNT(*) FROM chunks WHERE 1 = 1" + clause.sql;
    for (const auto &param : clause.params) {
      statement << param;
    }
    long long count = 0;
    statement >> count;
    return static_cast<size_t>(count);
  });
}

void IndexStore::remove_orphan_documents(sqlite::database &db) {
  db << "DELETE FROM documents WHERE NOT EXISTS "
        "(SELECT 1 FROM chunks WHERE chunks.document_id = documents.id)";
}

size_t IndexStore::delete_chunks(const std::vector<ChunkId> &ids) {
  if (ids.empty()) {
    return 0;
  }
  return guarded("delete_chunks", [&]() {
    PooledConnection conn(*db_manager_);
    Transaction tx(*conn, true);
    *conn << "DELETE FROM chunks WHERE id IN (" + id_vector_to_comma_string(ids) + ")";
    long long removed = 0;
    *conn << "SELECT changes()" >> removed;
    remove_orphan_documents(*conn);
    tx.commit();
    return static_cast<size_t>(removed);
  });
}

size_t IndexStore::delete_document(const std::string &source) {
  return guarded("delete_document", [&]() {
    PooledConnection conn(*db_manager_);
    Transaction tx(*conn, true);
    long long removed = 0;
    *conn << "SELECT COUNT(*) FROM chunks WHERE document_id IN "
             "(SELECT id FROM documents WHERE source = ?)"
          << source >>
        removed;
    // Chunks go with their document through ON DELETE CASCADE
    *conn << "DELETE FROM documents WHERE source = ?" << source;
    tx.commit();
    return static_cast<size_t>(removed);
  });
}

}  // namespace docent_core
