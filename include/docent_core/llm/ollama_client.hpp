#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docent_core/llm/chat_model.hpp"
#include "docent_core/llm/embedding_gateway.hpp"

class Ollama;

namespace docent_core {

class OllamaError : public LlmError {
 public:
  using LlmError::LlmError;
};

struct OllamaOptions {
  std::string url = "http://localhost:11434";
  std::string embedding_model = "mxbai-embed-large";
  std::string chat_model = "llama3.1";
  int read_timeout_seconds = 60;
};

// Every request opens its own connection, so embedding and chat calls from
// concurrent sessions run in parallel.
class OllamaClient : public EmbeddingGateway, public ChatModel {
 public:
  explicit OllamaClient(const OllamaOptions &options);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<float> get_embedding(const std::string &text) override;

  // The model is asked to reply in JSON following a small tool-call protocol
  // described in the first system message.
  ModelTurn chat(const std::vector<ChatMessage> &messages,
                 const std::vector<ToolSpec> &tools) override;

  bool is_server_available();

  // Interprets a raw reply. Accepted shapes:
  //   {"tool_calls": [{"name": ..., "arguments": {...}}, ...]}
  //   {"tool": ..., "arguments": {...}}
  //   {"answer": ...}
  // Anything else, including non-JSON text, is taken as a final answer.
  static ModelTurn parse_model_reply(const std::string &reply);

  static std::string tool_protocol_prompt(const std::vector<ToolSpec> &tools);

 private:
  OllamaOptions options_;

  // Helper methods
  void setup_server_connection() const;
  std::unique_ptr<Ollama> open_connection() const;
};

}  // namespace docent_core
