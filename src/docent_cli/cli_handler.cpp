#include "docent_cli/cli_handler.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "docent_core/agent/session_registry.hpp"
#include "docent_core/agent/tools/document_search_tool.hpp"
#include "docent_core/services/ingestion_service.hpp"
#include "docent_core/services/retrieval_service.hpp"

namespace docent_cli {

namespace {

int parse_int(const std::string &flag, const std::string &value) {
  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw CliError("Invalid number for " + flag + ": " + value);
    }
    return parsed;
  } catch (const std::logic_error &) {
    throw CliError("Invalid number for " + flag + ": " + value);
  }
}

}  // namespace

CliHandler::CliHandler(std::shared_ptr<docent_core::ServiceProvider> services)
    : services_(std::move(services)) {
  if (!services_) {
    throw CliError("CliHandler requires a service provider");
  }
}

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) {
  CliOptions options;

  if (argc < 2) {
    options.command = Command::Help;
    return options;
  }

  std::string command = argv[1];

  if (command == "help" || command == "h" || command == "--help" || command == "-h") {
    options.command = Command::Help;
    return options;
  }

  if ((argc - 2) % 2 != 0) {
    throw CliError("Missing value for flag " + std::string(argv[argc - 1]));
  }

  if (command == "ingest" || command == "i") {
    options.command = Command::Ingest;
    for (int i = 2; i < argc; i += 2) {
      std::string flag = argv[i];
      std::string value = argv[i + 1];

      if (flag == "--file" || flag == "-f") {
        options.file_paths.push_back(value);
      } else if (flag == "--department" || flag == "-d") {
        options.department = value;
      } else if (flag == "--type" || flag == "-t") {
        options.document_type = value;
      } else if (flag == "--filename" || flag == "-n") {
        options.filename = value;
      } else {
        throw CliError("Unknown flag for ingest: " + flag);
      }
    }
    if (options.file_paths.empty()) {
      throw CliError("Ingest command requires a file path. Usage: ingest --file <path> [--file <path>...]");
    }
    if (options.filename && options.file_paths.size() > 1) {
      throw CliError("--filename can only be used when ingesting a single file");
    }
  } else if (command == "search" || command == "s") {
    options.command = Command::Search;
    for (int i = 2; i < argc; i += 2) {
      std::string flag = argv[i];
      std::string value = argv[i + 1];

      if (flag == "--query" || flag == "-q") {
        options.query = value;
      } else if (flag == "--top-k" || flag == "-k") {
        options.top_k = parse_int(flag, value);
      } else if (flag == "--department" || flag == "-d") {
        options.department = value;
      } else if (flag == "--type" || flag == "-t") {
        options.document_type = value;
      } else {
        throw CliError("Unknown flag for search: " + flag);
      }
    }
    if (options.query.empty()) {
      throw CliError("Search command requires a query. Usage: search --query <query>");
    }
    if (options.top_k <= 0) {
      throw CliError("--top-k must be greater than 0");
    }
  } else if (command == "query" || command == "q") {
    options.command = Command::Query;
    for (int i = 2; i < argc; i += 2) {
      std::string flag = argv[i];
      std::string value = argv[i + 1];

      if (flag == "--message" || flag == "-m") {
        options.message = value;
      } else if (flag == "--user" || flag == "-u") {
        options.user_id = value;
      } else if (flag == "--department" || flag == "-d") {
        options.department = value;
      } else if (flag == "--token") {
        options.credential = value;
      } else if (flag == "--session") {
        options.session_id = value;
      } else {
        throw CliError("Unknown flag for query: " + flag);
      }
    }
    if (options.message.empty()) {
      throw CliError("Query command requires a message. Usage: query --message <text>");
    }
  } else if (command == "delete" || command == "rm") {
    options.command = Command::Delete;
    for (int i = 2; i < argc; i += 2) {
      std::string flag = argv[i];
      std::string value = argv[i + 1];

      if (flag == "--ids") {
        options.chunk_ids = parse_id_list(value);
      } else if (flag == "--source") {
        options.source = value;
      } else {
        throw CliError("Unknown flag for delete: " + flag);
      }
    }
    if (options.chunk_ids.empty() == options.source.empty()) {
      throw CliError("Delete command requires exactly one of --ids <id,id,...> or --source <path>");
    }
  } else {
    throw CliError("Unknown command: " + command);
  }

  return options;
}

std::vector<docent_core::ChunkId> CliHandler::parse_id_list(const std::string &value) {
  std::vector<docent_core::ChunkId> ids;
  std::stringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    if (item.empty()) {
      continue;
    }
    try {
      size_t consumed = 0;
      long long id = std::stoll(item, &consumed);
      if (consumed != item.size()) {
        throw CliError("Invalid chunk id: " + item);
      }
      ids.push_back(id);
    } catch (const std::logic_error &) {
      throw CliError("Invalid chunk id: " + item);
    }
  }
  return ids;
}

int CliHandler::execute_command(const CliOptions &options) {
  switch (options.command) {
    case Command::Ingest:
      return handle_ingest_command(options);
    case Command::Search:
      return handle_search_command(options);
    case Command::Query:
      return handle_query_command(options);
    case Command::Delete:
      return handle_delete_command(options);
    case Command::Help:
      print_help();
      return 0;
  }
  return 0;
}

int CliHandler::handle_ingest_command(const CliOptions &options) {
  auto &ingestion = services_->get_ingestion_service();
  const std::string department = options.department.value_or("general");
  const std::string document_type = options.document_type.value_or("general");

  docent_core::Metadata extra = docent_core::Metadata::object();
  if (options.filename) {
    extra[docent_core::metadata_keys::FILENAME] = *options.filename;
  }

  size_t failures = 0;
  for (const auto &path : options.file_paths) {
    std::cout << "Ingesting file: " << path << std::endl;
    try {
      auto ids = ingestion.ingest_file(path, department, document_type, extra);
      std::cout << "  stored " << ids.size() << " chunk(s)";
      if (!ids.empty()) {
        std::cout << " [" << ids.front() << ".." << ids.back() << "]";
      }
      std::cout << std::endl;
    } catch (const docent_core::IngestionError &e) {
      ++failures;
      print_error("Failed to ingest " + path + " (" + docent_core::to_string(e.kind()) +
                  "): " + e.what());
    }
  }

  if (options.file_paths.size() > 1) {
    std::cout << "Ingested " << (options.file_paths.size() - failures) << " of "
              << options.file_paths.size() << " file(s)" << std::endl;
  }
  return failures == 0 ? 0 : 1;
}

int CliHandler::handle_search_command(const CliOptions &options) {
  std::cout << "Search for: " << options.query << " (top_k: " << options.top_k << ")"
            << std::endl;

  docent_core::MetadataFilter filter;
  if (options.department) {
    filter[docent_core::metadata_keys::DEPARTMENT] = *options.department;
  }
  if (options.document_type) {
    filter[docent_core::metadata_keys::DOCUMENT_TYPE] = *options.document_type;
  }

  auto hits = services_->get_retrieval_service().search(options.query, options.top_k, filter);
  if (hits.empty()) {
    std::cout << "No results." << std::endl;
    return 0;
  }

  int rank = 1;
  for (const auto &hit : hits) {
    std::cout << rank++ << ". [chunk " << hit.chunk.id << ", score " << std::fixed
              << std::setprecision(4) << hit.score << "] "
              << docent_core::preview_text(hit.chunk.content, 200) << std::endl;
    std::cout << "   " << hit.chunk.metadata.dump() << std::endl;
  }
  return 0;
}

int CliHandler::handle_query_command(const CliOptions &options) {
  docent_core::UserContext context;
  context.user_id = options.user_id;
  context.department = options.department;
  context.credential = options.credential;

  auto orchestrator = services_->get_session_registry().get_or_create(options.session_id, context);
  docent_core::QueryResult result = orchestrator->query(options.message);

  std::cout << result.response << std::endl;

  if (!result.sources.empty()) {
    std::cout << std::endl << "Sources:" << std::endl;
    for (const auto &source : result.sources) {
      std::cout << "  - " << source.filename;
      if (source.document_type) {
        std::cout << " (" << *source.document_type;
        if (source.department) {
          std::cout << ", " << *source.department;
        }
        std::cout << ")";
      }
      std::cout << std::endl;
    }
  }
  if (!result.tools_used.empty()) {
    std::cout << std::endl << "Tools used:";
    for (const auto &tool : result.tools_used) {
      std::cout << " " << tool;
    }
    std::cout << std::endl;
  }

  if (!result.success) {
    print_error(result.error.value_or("query failed"));
    return 1;
  }
  return 0;
}

int CliHandler::handle_delete_command(const CliOptions &options) {
  auto &ingestion = services_->get_ingestion_service();
  try {
    size_t removed = options.source.empty() ? ingestion.delete_chunks(options.chunk_ids)
                                            : ingestion.delete_document(options.source);
    std::cout << "Deleted " << removed << " chunk(s)" << std::endl;
    return 0;
  } catch (const std::exception &e) {
    print_error("Failed to delete: " + std::string(e.what()));
    return 1;
  }
}

void CliHandler::print_error(const std::string &error) {
  std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
  std::cout << "docent - question answering over your organisation's documents\n\n"
            << "Usage: docent <command> [flags]\n\n"
            << "Commands:\n"
            << "  ingest, i   --file <path> [--file <path>...] [--department <d>] [--type <t>]\n"
            << "              [--filename <name>]   Load, chunk, embed and store documents\n"
            << "  search, s   --query <text> [--top-k <n>] [--department <d>] [--type <t>]\n"
            << "              Similarity search over stored chunks\n"
            << "  query, q    --message <text> [--user <id>] [--department <d>] [--token <t>]\n"
            << "              [--session <id>]   Ask a question and get a cited answer\n"
            << "  delete, rm  --ids <id,id,...> | --source <path>   Remove stored chunks\n"
            << "  help, h     Show this message\n\n"
            << "Configuration is read from docentrc.json, or the file named by DOCENT_CONFIG.\n"
            << "The database key comes from db_key in the config or DOCENT_DB_KEY."
            << std::endl;
}

}  // namespace docent_cli
