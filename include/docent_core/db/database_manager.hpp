#pragma once

#include <exception>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "docent_core/db/connection_pool.hpp"

namespace docent_core {

// Raised when no connection can be handed out (not initialized, shut down,
// or the database could not be opened/keyed).
class DatabaseUnavailableError : public std::exception {
 public:
  explicit DatabaseUnavailableError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class DatabaseManager {
 public:
  DatabaseManager() = default;
  ~DatabaseManager();

  // Creates the schema and the connection pool. Calling it again while
  // initialized is a no-op.
  void initialize(const std::filesystem::path &db_path, const std::string &db_key, int pool_size);

  // These methods are used by the PooledConnection guard
  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);

  void shutdown();
  bool is_initialized() const;

  DatabaseManager(const DatabaseManager &) = delete;
  DatabaseManager &operator=(const DatabaseManager &) = delete;

 private:
  void setup_schema(const std::filesystem::path &db_path, const std::string &db_key);

  mutable std::mutex state_mutex_;
  std::unique_ptr<ConnectionPool> pool_;
  bool is_initialized_ = false;
};

}  // namespace docent_core
