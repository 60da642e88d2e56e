#include <curl/curl.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "docent_cli/cli_handler.hpp"
#include "docent_cli/config.hpp"
#include "docent_core/agent/session_registry.hpp"
#include "docent_core/agent/tool_registry.hpp"
#include "docent_core/agent/tools/chat_history_search_tool.hpp"
#include "docent_core/agent/tools/document_search_tool.hpp"
#include "docent_core/agent/tools/response_format_tool.hpp"
#include "docent_core/agent/tools/user_data_tool.hpp"
#include "docent_core/db/database_manager.hpp"
#include "docent_core/db/index_store.hpp"
#include "docent_core/llm/ollama_client.hpp"
#include "docent_core/loaders/loader_registry.hpp"
#include "docent_core/portal/http_portal_client.hpp"
#include "docent_core/service_provider.hpp"
#include "docent_core/services/chat_history_recorder.hpp"
#include "docent_core/services/ingestion_service.hpp"
#include "docent_core/services/retrieval_service.hpp"

namespace {

docent_cli::Config load_config() {
  const char *config_env = std::getenv("DOCENT_CONFIG");
  if (config_env && *config_env) {
    return docent_cli::Config::from_file(config_env);
  }
  if (std::filesystem::exists("docentrc.json")) {
    return docent_cli::Config::from_file("docentrc.json");
  }
  std::cerr << "No docentrc.json found, using default configuration" << std::endl;
  return docent_cli::Config::from_json(nlohmann::json::object());
}

std::shared_ptr<docent_core::ToolRegistry> build_tool_registry(
    const docent_cli::Config &config,
    std::shared_ptr<docent_core::RetrievalService> retrieval,
    std::shared_ptr<docent_core::UserDataPortal> portal) {
  auto registry = std::make_shared<docent_core::ToolRegistry>();
  registry->register_tool(std::make_shared<docent_core::DocumentSearchTool>(
      retrieval, docent_core::DocumentSearchOptions{
                     .k = config.document_search_k,
                     .preview_chars = static_cast<size_t>(config.document_preview_chars)}));
  registry->register_tool(std::make_shared<docent_core::ChatHistorySearchTool>(
      retrieval, docent_core::ChatHistorySearchOptions{
                     .k = config.history_search_k,
                     .preview_chars = static_cast<size_t>(config.history_preview_chars)}));
  registry->register_tool(std::make_shared<docent_core::UserDataTool>(portal));
  registry->register_tool(std::make_shared<docent_core::ResponseFormatTool>());
  return registry;
}

}  // namespace

int main(int argc, char *argv[]) {
  try {
    docent_cli::CliOptions options = docent_cli::CliHandler::parse_arguments(argc, argv);
    if (options.command == docent_cli::Command::Help) {
      docent_cli::CliHandler::print_help();
      return 0;
    }

    docent_cli::Config config = load_config();

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("Failed to initialize libcurl");
    }

    auto db_manager = std::make_shared<docent_core::DatabaseManager>();
    db_manager->initialize(config.index_db_path, config.database_key(), config.db_pool_size);

    // Deleting needs no model server
    std::shared_ptr<docent_core::OllamaClient> ollama_client;
    if (options.command != docent_cli::Command::Delete) {
      ollama_client = std::make_shared<docent_core::OllamaClient>(docent_core::OllamaOptions{
          .url = config.ollama_url,
          .embedding_model = config.embedding_model,
          .chat_model = config.chat_model,
          .read_timeout_seconds = std::max(1, config.model_timeout_ms / 1000)});
    }

    auto index_store = std::make_shared<docent_core::IndexStore>(db_manager, config.embedding_dimension);
    auto ingestion_service = std::make_shared<docent_core::IngestionService>(
        index_store, ollama_client, docent_core::LoaderRegistry::create_default(),
        docent_core::IngestionOptions{
            .chunker = {.chunk_size = static_cast<size_t>(config.chunk_size),
                        .chunk_overlap = static_cast<size_t>(config.chunk_overlap)}});
    auto retrieval_service =
        std::make_shared<docent_core::RetrievalService>(index_store, ollama_client);

    auto portal = std::make_shared<docent_core::HttpPortalClient>(docent_core::PortalOptions{
        .base_url = config.portal_base_url,
        .api_key = config.portal_api_key,
        .timeout_ms = config.tool_timeout_ms});
    auto tools = build_tool_registry(config, retrieval_service, portal);
    auto recorder = std::make_shared<docent_core::ChatHistoryRecorder>(ingestion_service);

    docent_core::OrchestratorConfig orchestrator_config{
        .max_iterations = config.max_iterations,
        .memory_window = static_cast<size_t>(config.memory_window),
        .tool_timeout = std::chrono::milliseconds(config.tool_timeout_ms),
        .model_timeout = std::chrono::milliseconds(config.model_timeout_ms),
        .record_chat_history = config.record_chat_history};
    auto sessions = std::make_shared<docent_core::SessionRegistry>(
        [ollama_client, tools, recorder, orchestrator_config](
            const docent_core::UserContext &context) {
          return std::make_shared<docent_core::ToolOrchestrator>(
              ollama_client, tools, recorder, orchestrator_config, context);
        });

    auto services = std::make_shared<docent_core::ServiceProvider>(
        ingestion_service, retrieval_service, sessions);

    int exit_code = 0;
    {
      docent_cli::CliHandler handler(services);
      exit_code = handler.execute_command(options);
    }

    db_manager->shutdown();
    curl_global_cleanup();
    return exit_code;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
