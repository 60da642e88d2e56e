#pragma once

#include <cstdlib>
#include <exception>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

namespace docent_cli {

class ConfigError : public std::exception {
 public:
  explicit ConfigError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class Config {
 public:
  // Index store
  std::string index_db_path;
  std::string db_key;
  int db_pool_size;

  // Model server
  std::string ollama_url;
  std::string embedding_model;
  std::string chat_model;
  int embedding_dimension;

  // Ingestion
  int chunk_size;
  int chunk_overlap;

  // Orchestration
  int max_iterations;
  int memory_window;
  int document_search_k;
  int document_preview_chars;
  int history_search_k;
  int history_preview_chars;
  int tool_timeout_ms;
  int model_timeout_ms;
  bool record_chat_history;

  // Internal portal
  std::string portal_base_url;
  std::string portal_api_key;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw ConfigError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception &e) {
      throw ConfigError(std::string("Failed to parse JSON in config file '") + filename +
                        "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json &json_config) {
    if (!json_config.is_object()) {
      throw ConfigError("Configuration must be a JSON object");
    }

    Config config;
    try {
      // Apply defaults when keys are missing
      config.index_db_path = json_config.value("index_db_path", std::string("./data/docent.db"));
      config.db_key = json_config.value("db_key", std::string());
      config.db_pool_size = json_config.value("db_pool_size", 4);

      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model =
          json_config.value("embedding_model", std::string("mxbai-embed-large"));
      config.chat_model = json_config.value("chat_model", std::string("llama3.1"));
      config.embedding_dimension = json_config.value("embedding_dimension", 1024);

      config.chunk_size = json_config.value("chunk_size", 1000);
      config.chunk_overlap = json_config.value("chunk_overlap", 100);

      config.max_iterations = json_config.value("max_iterations", 3);
      config.memory_window = json_config.value("memory_window", 5);
      config.document_search_k = json_config.value("document_search_k", 3);
      config.document_preview_chars = json_config.value("document_preview_chars", 300);
      config.history_search_k = json_config.value("history_search_k", 2);
      config.history_preview_chars = json_config.value("history_preview_chars", 200);
      config.tool_timeout_ms = json_config.value("tool_timeout_ms", 10000);
      config.model_timeout_ms = json_config.value("model_timeout_ms", 60000);
      config.record_chat_history = json_config.value("record_chat_history", true);

      config.portal_base_url = json_config.value("portal_base_url", std::string());
      config.portal_api_key = json_config.value("portal_api_key", std::string());
    } catch (const nlohmann::json::type_error &e) {
      throw ConfigError(std::string("Configuration value has the wrong type: ") + e.what());
    }

    config.validate();
    return config;
  }

  // The configured key, or DOCENT_DB_KEY from the environment
  std::string database_key() const {
    if (!db_key.empty()) {
      return db_key;
    }
    const char *env_key = std::getenv("DOCENT_DB_KEY");
    if (env_key && *env_key) {
      return env_key;
    }
    throw ConfigError("No database key: set db_key in the config file or DOCENT_DB_KEY");
  }

 private:
  void validate() const {
    if (index_db_path.empty()) {
      throw ConfigError("index_db_path cannot be empty");
    }
    if (db_pool_size <= 0) {
      throw ConfigError("db_pool_size must be greater than 0");
    }
    if (ollama_url.empty()) {
      throw ConfigError("ollama_url cannot be empty");
    }
    if (embedding_model.empty() || chat_model.empty()) {
      throw ConfigError("embedding_model and chat_model cannot be empty");
    }
    if (embedding_dimension <= 0) {
      throw ConfigError("embedding_dimension must be greater than 0");
    }
    if (chunk_size <= 0) {
      throw ConfigError("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw ConfigError("chunk_overlap must be at least 0 and smaller than chunk_size");
    }
    if (max_iterations < 1) {
      throw ConfigError("max_iterations must be at least 1");
    }
    if (memory_window < 0) {
      throw ConfigError("memory_window cannot be negative");
    }
    if (document_search_k <= 0 || history_search_k <= 0) {
      throw ConfigError("document_search_k and history_search_k must be greater than 0");
    }
    if (document_preview_chars <= 0 || history_preview_chars <= 0) {
      throw ConfigError("preview lengths must be greater than 0");
    }
    if (tool_timeout_ms <= 0 || model_timeout_ms <= 0) {
      throw ConfigError("tool_timeout_ms and model_timeout_ms must be greater than 0");
    }
  }
};

}  // namespace docent_cli
