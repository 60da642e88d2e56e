#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "docent_core/llm/llm_error.hpp"

namespace docent_core {

struct ChatMessage {
  std::string role;  // "system", "user", "assistant" or "tool"
  std::string content;
};

// What the model is told about one tool.
struct ToolSpec {
  std::string name;
  std::string description;
  nlohmann::json parameters = nlohmann::json::object();
};

struct ToolCall {
  std::string name;
  nlohmann::json arguments = nlohmann::json::object();
};

// One model reply: either tool calls to run or a final answer.
struct ModelTurn {
  std::string content;
  std::vector<ToolCall> tool_calls;

  bool is_final() const {
    return tool_calls.empty();
  }
};

class ChatModel {
 public:
  virtual ~ChatModel() = default;

  // Throws LlmError when the model cannot be reached.
  virtual ModelTurn chat(const std::vector<ChatMessage> &messages,
                         const std::vector<ToolSpec> &tools) = 0;
};

}  // namespace docent_core
