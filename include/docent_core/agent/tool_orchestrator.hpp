#pragma once

#include <chrono>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "docent_core/agent/tool.hpp"
#include "docent_core/agent/tool_registry.hpp"
#include "docent_core/agent/user_context.hpp"
#include "docent_core/async/cancellation_token.hpp"
#include "docent_core/llm/chat_model.hpp"
#include "docent_core/services/chat_history_recorder.hpp"
#include "docent_core/types/source_record.hpp"

namespace docent_core {

// The generative model could not be reached or did not answer in time.
class ModelUnavailableError : public std::exception {
 public:
  explicit ModelUnavailableError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct OrchestratorConfig {
  // Upper bound on model turns that lead to tool dispatch
  int max_iterations = 3;
  // Past exchanges replayed to the model
  size_t memory_window = 5;
  std::chrono::milliseconds tool_timeout{10000};
  std::chrono::milliseconds model_timeout{60000};
  bool record_chat_history = true;
};

struct QueryResult {
  std::string response;
  std::vector<SourceRecord> sources;
  bool success = false;
  std::vector<std::string> tools_used;
  std::optional<std::string> error;
  int iterations = 0;
  // The iteration cap ended the loop before the model answered
  bool exhausted = false;

  static QueryResult failure_response(const std::string &response,
                                      const std::string &error,
                                      std::vector<std::string> tools_used = {}) {
    QueryResult result;
    result.response = response;
    result.error = error;
    result.tools_used = std::move(tools_used);
    return result;
  }
};

inline constexpr const char *APOLOGY_MESSAGE =
    "I apologize, but I encountered an error while processing your request. Please try again "
    "later.";

/**
 * @class ToolOrchestrator
 * @brief Runs the think/act loop of one conversation.
 *
 * Each query asks the model for either a final answer or tool calls, runs the
 * requested tools and feeds their output back, for at most max_iterations
 * dispatch rounds. Sources surfaced by the tools are collected in a scope
 * owned by the query and returned with the answer.
 *
 * One orchestrator holds the memory of one session. Concurrent queries on the
 * same orchestrator are serialised; separate orchestrators share nothing but
 * the injected services.
 */
class ToolOrchestrator {
 public:
  ToolOrchestrator(std::shared_ptr<ChatModel> model,
                   std::shared_ptr<ToolRegistry> tools,
                   std::shared_ptr<ChatHistoryRecorder> recorder,
                   OrchestratorConfig config,
                   UserContext user_context);

  ToolOrchestrator(const ToolOrchestrator &) = delete;
  ToolOrchestrator &operator=(const ToolOrchestrator &) = delete;

  QueryResult query(const std::string &user_input,
                    const async::CancellationToken &cancel = async::CancellationToken());

  void update_context(const nlohmann::json &fields);
  // Replaces the whole context. Memory is cleared when the user changes.
  void set_user_context(UserContext context);
  void clear_memory();

  size_t memory_size() const;
  UserContext user_context() const;
  const OrchestratorConfig &config() const {
    return config_;
  }

  static std::string system_prompt(const UserContext &user);

 private:
  struct Exchange {
    std::string user;
    std::string assistant;
  };

  struct DispatchOutcome {
    std::string tool_name;
    ToolResult result;
  };

  ModelTurn call_model(const std::vector<ChatMessage> &conversation,
                       const async::CancellationToken &cancel);

  std::vector<DispatchOutcome> dispatch(const std::vector<ToolCall> &calls,
                                        QueryScope &request_scope,
                                        const UserContext &user,
                                        const async::CancellationToken &cancel);

  static std::vector<ToolCall> in_dispatch_order(const std::vector<ToolCall> &calls);

  std::vector<ChatMessage> build_conversation(const UserContext &user,
                                              const std::string &user_input) const;
  void remember(const std::string &user_input, const std::string &answer);

  std::shared_ptr<ChatModel> model_;
  std::shared_ptr<ToolRegistry> tools_;
  std::shared_ptr<ChatHistoryRecorder> recorder_;
  OrchestratorConfig config_;

  // Held for the whole query
  std::mutex session_mutex_;

  mutable std::mutex state_mutex_;
  UserContext user_context_;
  std::deque<Exchange> memory_;
};

}  // namespace docent_core
