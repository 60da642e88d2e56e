#pragma once
#include <sqlite_modern_cpp.h>

#include <memory>

#include "docent_core/db/database_manager.hpp"

namespace docent_core {
class PooledConnection {
 public:
  // Borrows a connection from the manager's pool
  explicit PooledConnection(DatabaseManager &manager)
      : manager_(manager), conn_(manager.get_connection()) {
    if (!conn_) {
      throw DatabaseUnavailableError(
          "Failed to acquire database connection: system is shutting down.");
    }
  }
  // Hands the connection back
  ~PooledConnection() {
    if (conn_) {
      manager_.return_connection(std::move(conn_));
    }
  }

  sqlite::database *operator->() const {
    return conn_.get();
  }
  sqlite::database &operator*() const {
    return *conn_;
  }

  PooledConnection(const PooledConnection &) = delete;
  PooledConnection &operator=(const PooledConnection &) = delete;

 private:
  DatabaseManager &manager_;
  std::unique_ptr<sqlite::database> conn_;
};
}  // namespace docent_core
