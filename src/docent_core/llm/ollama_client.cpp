#include "docent_core/llm/ollama_client.hpp"

#include <optional>

#include "ollama.hpp"

namespace docent_core {

OllamaClient::OllamaClient(const OllamaOptions &options) : options_(options) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() const {
  if (!open_connection()->is_running()) {
    throw OllamaError("Ollama server is not running at " + options_.url);
  }
}

std::unique_ptr<Ollama> OllamaClient::open_connection() const {
  auto connection = std::make_unique<Ollama>(options_.url);
  connection->setReadTimeout(options_.read_timeout_seconds);
  return connection;
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  try {
    auto connection = open_connection();
    ollama::response response = connection->generate_embeddings(options_.embedding_model, text);
    auto json_response = response.as_json();

    if (!json_response.contains("embeddings")) {
      throw OllamaError("Response does not contain embedding field");
    }

    // Either an array of vectors or a single vector
    const auto &embeddings = json_response["embeddings"];
    if (!embeddings.is_array() || embeddings.empty()) {
      throw OllamaError("Embeddings field is not a non-empty array");
    }
    if (embeddings[0].is_array()) {
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();
  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Malformed embedding response: " + std::string(e.what()));
  }
}

std::string OllamaClient::tool_protocol_prompt(const std::vector<ToolSpec> &tools) {
  nlohmann::json catalog = nlohmann::json::array();
  for (const auto &tool : tools) {
    catalog.push_back({{"name", tool.name},
                       {"description", tool.description},
                       {"parameters", tool.parameters}});
  }

  std::string prompt =
      "Always reply with a single JSON object.\n"
      "To use tools reply {\"tool_calls\": [{\"name\": \"<tool name>\", \"arguments\": {...}}]}.\n"
      "Tool results are sent back to you as messages with the role \"tool\".\n"
      "When you are ready to answer the user reply {\"answer\": \"<your answer>\"}.\n";
  if (tools.empty()) {
    prompt += "No tools are available for this conversation.";
  } else {
    prompt += "Available tools:\n" + catalog.dump(2);
  }
  return prompt;
}

ModelTurn OllamaClient::chat(const std::vector<ChatMessage> &messages,
                             const std::vector<ToolSpec> &tools) {
  try {
    ollama::messages conversation;
    conversation.push_back(ollama::message("system", tool_protocol_prompt(tools)));
    for (const auto &message : messages) {
      conversation.push_back(ollama::message(message.role, message.content));
    }

    auto connection = open_connection();
    ollama::response response =
        connection->chat(options_.chat_model, conversation, nullptr, "json");
    auto json_response = response.as_json();
    if (!json_response.contains("message") || !json_response["message"].contains("content")) {
      throw OllamaError("Chat response does not contain a message");
    }
    return parse_model_reply(json_response["message"]["content"].get<std::string>());
  } catch (const ollama::exception &e) {
    throw OllamaError("Chat request failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Malformed chat response: " + std::string(e.what()));
  }
}

ModelTurn OllamaClient::parse_model_reply(const std::string &reply) {
  ModelTurn turn;
  const auto parsed = nlohmann::json::parse(reply, nullptr, /*allow_exceptions*/ false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    turn.content = reply;
    return turn;
  }

  auto read_call = [](const nlohmann::json &entry) -> std::optional<ToolCall> {
    if (!entry.is_object()) {
      return std::nullopt;
    }
    std::string name;
    if (entry.contains("name") && entry["name"].is_string()) {
      name = entry["name"].get<std::string>();
    } else if (entry.contains("tool") && entry["tool"].is_string()) {
      name = entry["tool"].get<std::string>();
    }
    if (name.empty()) {
      return std::nullopt;
    }

    ToolCall call{.name = name};
    if (entry.contains("arguments")) {
      const auto &arguments = entry["arguments"];
      if (arguments.is_object()) {
        call.arguments = arguments;
      } else if (arguments.is_string()) {
        // Some models double-encode the arguments
        auto decoded = nlohmann::json::parse(arguments.get<std::string>(), nullptr, false);
        if (!decoded.is_discarded() && decoded.is_object()) {
          call.arguments = decoded;
        }
      }
    }
    return call;
  };

  if (parsed.contains("tool_calls") && parsed["tool_calls"].is_array()) {
    for (const auto &entry : parsed["tool_calls"]) {
      if (auto call = read_call(entry)) {
        turn.tool_calls.push_back(std::move(*call));
      }
    }
  } else if (parsed.contains("tool")) {
    if (auto call = read_call(parsed)) {
      turn.tool_calls.push_back(std::move(*call));
    }
  }

  for (const char *key : {"answer", "response", "content"}) {
    if (parsed.contains(key) && parsed[key].is_string()) {
      turn.content = parsed[key].get<std::string>();
      return turn;
    }
  }
  if (turn.tool_calls.empty()) {
    turn.content = parsed.dump();
  }
  return turn;
}

bool OllamaClient::is_server_available() {
  return open_connection()->is_running();
}

}  // namespace docent_core
