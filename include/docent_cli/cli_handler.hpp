#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docent_core/service_provider.hpp"
#include "docent_core/types/chunk.hpp"

namespace docent_cli {

enum class Command { Ingest, Search, Query, Delete, Help };

struct CliOptions {
  Command command = Command::Help;

  // ingest
  std::vector<std::string> file_paths;
  std::optional<std::string> filename;

  // ingest, search, query
  std::optional<std::string> department;
  std::optional<std::string> document_type;

  // search
  std::string query;
  int top_k = 3;

  // query
  std::string message;
  std::string user_id;
  std::optional<std::string> credential;
  std::string session_id = "cli";

  // delete
  std::vector<docent_core::ChunkId> chunk_ids;
  std::string source;
};

class CliError : public std::exception {
 public:
  explicit CliError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class CliHandler {
 public:
  explicit CliHandler(std::shared_ptr<docent_core::ServiceProvider> services);

  // Disable copy constructor and assignment
  CliHandler(const CliHandler &) = delete;
  CliHandler &operator=(const CliHandler &) = delete;

  // Parse command line arguments. Throws CliError on bad usage.
  static CliOptions parse_arguments(int argc, char *argv[]);

  // Execute command, returning the process exit code
  int execute_command(const CliOptions &options);

  static void print_help();

 private:
  std::shared_ptr<docent_core::ServiceProvider> services_;

  // Command handlers
  int handle_ingest_command(const CliOptions &options);
  int handle_search_command(const CliOptions &options);
  int handle_query_command(const CliOptions &options);
  int handle_delete_command(const CliOptions &options);

  static std::vector<docent_core::ChunkId> parse_id_list(const std::string &value);
  static void print_error(const std::string &error);
};

}  // namespace docent_cli
