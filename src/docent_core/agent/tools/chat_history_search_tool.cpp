#include "docent_core/agent/tools/chat_history_search_tool.hpp"

#include <utility>

#include "docent_core/agent/tools/document_search_tool.hpp"

namespace docent_core {

ChatHistorySearchTool::ChatHistorySearchTool(std::shared_ptr<RetrievalService> retrieval,
                                             ChatHistorySearchOptions options)
    : retrieval_(std::move(retrieval)), options_(options) {}

ToolSpec ChatHistorySearchTool::spec() const {
  return ToolSpec{
      .name = NAME,
      .description = "Search through previous chat conversations to provide consistent "
                     "responses and context.",
      .parameters = {{"type", "object"},
                     {"properties",
                      {{"query", {{"type", "string"}, {"description", "What to look for"}}}}},
                     {"required", nlohmann::json::array({"query"})}}};
}

ToolResult ChatHistorySearchTool::invoke(const nlohmann::json &arguments,
                                         const ToolContext &context) {
  const auto query = string_argument(arguments, "query");
  if (!query) {
    return ToolResult::failure_response(ToolErrorKind::InvalidArguments,
                                        "search_chat_history needs a non-empty 'query' argument.");
  }

  MetadataFilter filter{{metadata_keys::TYPE, CHAT_HISTORY}};
  // Callers only ever see their own history
  if (context.user.has_user()) {
    filter[metadata_keys::USER_ID] = context.user.user_id;
  } else if (auto user_id = string_argument(arguments, "user_id")) {
    filter[metadata_keys::USER_ID] = *user_id;
  }

  const auto hits = retrieval_->search(*query, options_.k, filter);
  if (hits.empty()) {
    return ToolResult::success_response("No relevant chat history found.");
  }

  std::string output = "Previous relevant conversations:\n";
  for (size_t i = 0; i < hits.size(); ++i) {
    if (i > 0) {
      output += "\n\n";
    }
    output += std::to_string(i + 1) + ". " +
              preview_text(hits[i].chunk.content, options_.preview_chars);
  }
  return ToolResult::success_response(output);
}

}  // namespace docent_core
