#pragma once

#include <memory>

#include "docent_core/agent/tool.hpp"
#include "docent_core/services/retrieval_service.hpp"

namespace docent_core {

struct ChatHistorySearchOptions {
  int k = 2;
  size_t preview_chars = 200;
};

// "search_chat_history": earlier exchanges of the calling user. Results are
// context for the model and are never cited.
class ChatHistorySearchTool : public Tool {
 public:
  static constexpr const char *NAME = "search_chat_history";

  ChatHistorySearchTool(std::shared_ptr<RetrievalService> retrieval,
                        ChatHistorySearchOptions options = {});

  std::string name() const override {
    return NAME;
  }
  ToolSpec spec() const override;
  ToolResult invoke(const nlohmann::json &arguments, const ToolContext &context) override;

 private:
  std::shared_ptr<RetrievalService> retrieval_;
  ChatHistorySearchOptions options_;
};

}  // namespace docent_core
