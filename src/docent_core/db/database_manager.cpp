#include <sqlcipher/sqlite3.h>

#include "docent_core/db/database_manager.hpp"

#include <stdexcept>

namespace docent_core {

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::initialize(const std::filesystem::path &db_path,
                                 const std::string &db_key,
                                 int pool_size) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (is_initialized_) {
    return;
  }
  if (pool_size <= 0) {
    throw std::invalid_argument("DatabaseManager pool_size must be greater than 0");
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  // 1. One-time schema setup before creating the pool
  setup_schema(db_path, db_key);

  // 2. Connection pool shared by every store operation
  pool_ = std::make_unique<ConnectionPool>(db_path.string(), db_key, pool_size);

  is_initialized_ = true;
}

void DatabaseManager::shutdown() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  is_initialized_ = false;
}

bool DatabaseManager::is_initialized() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return is_initialized_;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  ConnectionPool *pool = nullptr;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!is_initialized_) {
      throw DatabaseUnavailableError("DatabaseManager has not been initialized.");
    }
    pool = pool_.get();
  }
  return pool->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const std::filesystem::path &db_path,
                                   const std::string &db_key) {
  // Use a temporary, single-use connection just for schema setup.
  sqlite::database db(db_path.string());
  sqlite3 *handle = db.connection().get();
  if (!handle) {
    throw DatabaseUnavailableError("Setup: Failed to get native database handle.");
  }
  if (sqlite3_key(handle, db_key.c_str(), static_cast<int>(db_key.length())) != SQLITE_OK) {
    throw DatabaseUnavailableError("Setup: Failed to key database: " +
                                   std::string(sqlite3_errmsg(handle)));
  }
  db << "SELECT count(*) FROM sqlite_master;";
  db << "PRAGMA foreign_keys = ON;";
  db << "PRAGMA journal_mode = WAL;";

  // One row per ingested document; content_hash makes ingestion idempotent
  db << R"(
      CREATE TABLE IF NOT EXISTS documents (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          content_hash TEXT UNIQUE NOT NULL,
          source TEXT,
          chunk_count INTEGER NOT NULL DEFAULT 0,
          created_at TEXT NOT NULL
      )
    )";

  // Chunks are append-only. The filter columns mirror the metadata keys
  // retrieval can constrain on; everything else lives in the metadata JSON.
  db << R"(
      CREATE TABLE IF NOT EXISTS chunks (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          document_id INTEGER NOT NULL,
          chunk_index INTEGER NOT NULL,
          content BLOB NOT NULL,
          vector_blob BLOB NOT NULL,
          metadata TEXT NOT NULL,
          type TEXT,
          document_type TEXT,
          department TEXT,
          user_id TEXT,
          FOREIGN KEY (document_id) REFERENCES documents(id) ON DELETE CASCADE
      )
    )";

  db << R"(
      CREATE INDEX IF NOT EXISTS idx_chunks_filter
      ON chunks(type, department, document_type)
    )";
  db << R"(
      CREATE INDEX IF NOT EXISTS idx_chunks_document
      ON chunks(document_id, chunk_index)
    )";
  db << "CREATE INDEX IF NOT EXISTS idx_documents_source ON documents(source)";
}

}  // namespace docent_core
