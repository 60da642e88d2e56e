#include "docent_core/agent/tool_orchestrator.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "docent_core/agent/tools/chat_history_search_tool.hpp"
#include "docent_core/agent/tools/document_search_tool.hpp"
#include "docent_core/async/timed_call.hpp"
#include "docent_core/provenance/citations.hpp"
#include "docent_core/provenance/query_scope.hpp"

namespace docent_core {

namespace {

class QueryCancelled : public std::exception {
 public:
  const char *what() const noexcept override {
    return "query cancelled";
  }
};

int dispatch_rank(const std::string &tool_name) {
  if (tool_name == DocumentSearchTool::NAME) {
    return 0;
  }
  if (tool_name == ChatHistorySearchTool::NAME) {
    return 1;
  }
  return 2;
}

std::string join(const std::vector<std::string> &items, const std::string &separator) {
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += items[i];
  }
  return out;
}

std::string describe_tool_calls(const std::vector<ToolCall> &calls) {
  nlohmann::json serialized = nlohmann::json::array();
  for (const auto &call : calls) {
    serialized.push_back({{"name", call.name}, {"arguments", call.arguments}});
  }
  return nlohmann::json{{"tool_calls", serialized}}.dump();
}

}  // namespace

ToolOrchestrator::ToolOrchestrator(std::shared_ptr<ChatModel> model,
                                   std::shared_ptr<ToolRegistry> tools,
                                   std::shared_ptr<ChatHistoryRecorder> recorder,
                                   OrchestratorConfig config,
                                   UserContext user_context)
    : model_(std::move(model)),
      tools_(std::move(tools)),
      recorder_(std::move(recorder)),
      config_(config),
      user_context_(std::move(user_context)) {
  if (!model_ || !tools_) {
    throw std::invalid_argument("ToolOrchestrator needs a model and a tool registry");
  }
  if (config_.max_iterations < 1) {
    throw std::invalid_argument("max_iterations must be at least 1");
  }
}

std::string ToolOrchestrator::system_prompt(const UserContext &user) {
  return "You are Docent, an assistant for staff and citizens of government and private "
         "offices. Help them with accurate information and resolve their questions efficiently.\n"
         "\n"
         "You can:\n"
         "1. Search official documents and policies (search_documents)\n"
         "2. Look up earlier conversations with this user (search_chat_history)\n"
         "3. Fetch personal records when the user is authenticated (fetch_user_data)\n"
         "4. Format structured data for an API response (create_api_response)\n"
         "\n"
         "Guidelines:\n"
         "- Prefer official information and say so when you are unsure.\n"
         "- Only request personal records for authenticated users.\n"
         "- Keep answers concise and professional.\n"
         "- Base answers on the documents you found; citations are attached for you.\n"
         "\n"
         "User Context: " +
         user.to_prompt_json().dump();
}

UserContext ToolOrchestrator::user_context() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return user_context_;
}

void ToolOrchestrator::update_context(const nlohmann::json &fields) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  user_context_.merge(fields);
}

void ToolOrchestrator::set_user_context(UserContext context) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (context.user_id != user_context_.user_id) {
    memory_.clear();
  }
  user_context_ = std::move(context);
}

void ToolOrchestrator::clear_memory() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  memory_.clear();
}

size_t ToolOrchestrator::memory_size() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return memory_.size();
}

void ToolOrchestrator::remember(const std::string &user_input, const std::string &answer) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  memory_.push_back(Exchange{.user = user_input, .assistant = answer});
  while (memory_.size() > config_.memory_window) {
    memory_.pop_front();
  }
}

std::vector<ChatMessage> ToolOrchestrator::build_conversation(const UserContext &user,
                                                              const std::string &user_input) const {
  std::vector<ChatMessage> conversation;
  conversation.push_back({"system", system_prompt(user)});
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    for (const auto &exchange : memory_) {
      conversation.push_back({"user", exchange.user});
      conversation.push_back({"assistant", exchange.assistant});
    }
  }
  conversation.push_back({"user", user_input});
  return conversation;
}

std::vector<ToolCall> ToolOrchestrator::in_dispatch_order(const std::vector<ToolCall> &calls) {
  std::vector<ToolCall> ordered = calls;
  std::stable_sort(ordered.begin(), ordered.end(), [](const ToolCall &a, const ToolCall &b) {
    return dispatch_rank(a.name) < dispatch_rank(b.name);
  });
  return ordered;
}

ModelTurn ToolOrchestrator::call_model(const std::vector<ChatMessage> &conversation,
                                       const async::CancellationToken &cancel) {
  auto model = model_;
  std::vector<ToolSpec> specs = tools_->specs();
  auto future = async::launch_detached(
      [model, conversation, specs]() { return model->chat(conversation, specs); });

  switch (async::wait_for_result(future, config_.model_timeout, cancel)) {
    case async::WaitStatus::Cancelled:
      throw QueryCancelled();
    case async::WaitStatus::TimedOut:
      throw ModelUnavailableError("Model did not answer within " +
                                  std::to_string(config_.model_timeout.count()) + " ms");
    case async::WaitStatus::Ready:
      break;
  }

  try {
    return future.get();
  } catch (const LlmError &e) {
    throw ModelUnavailableError(std::string("Model request failed: ") + e.what());
  }
}

std::vector<ToolOrchestrator::DispatchOutcome> ToolOrchestrator::dispatch(
    const std::vector<ToolCall> &calls,
    QueryScope &request_scope,
    const UserContext &user,
    const async::CancellationToken &cancel) {
  struct Pending {
    std::string name;
    std::shared_ptr<QueryScope> staging;
    async::CancellationToken token;
    std::future<ToolResult> future;
    std::optional<ToolResult> immediate;
  };

  // Start every call at once; each writes its sources into its own staging scope
  std::vector<Pending> pending;
  pending.reserve(calls.size());
  for (const auto &call : in_dispatch_order(calls)) {
    Pending entry;
    entry.name = call.name;
    ToolPtr tool = tools_->find(call.name);
    if (!tool) {
      entry.immediate = ToolResult::failure_response(
          ToolErrorKind::UnknownTool,
          "Unknown tool '" + call.name + "'. Available tools: " + join(tools_->names(), ", "));
    } else {
      entry.staging = std::make_shared<QueryScope>();
      ToolContext context{.scope = entry.staging, .user = user, .cancel = entry.token};
      nlohmann::json arguments = call.arguments;
      entry.future = async::launch_detached(
          [tool, arguments, context]() { return tool->invoke(arguments, context); });
    }
    pending.push_back(std::move(entry));
  }

  const bool bounded = config_.tool_timeout.count() > 0;
  const auto deadline = std::chrono::steady_clock::now() + config_.tool_timeout;

  // Collect in dispatch order so merged sources and outputs are deterministic
  std::vector<DispatchOutcome> outcomes;
  outcomes.reserve(pending.size());
  for (auto &entry : pending) {
    if (entry.immediate) {
      outcomes.push_back({entry.name, *entry.immediate});
      continue;
    }

    auto remaining = std::chrono::milliseconds(0);
    if (bounded) {
      remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      remaining = std::max(remaining, std::chrono::milliseconds(1));
    }

    switch (async::wait_for_result(entry.future, remaining, cancel)) {
      case async::WaitStatus::Cancelled:
        for (auto &other : pending) {
          other.token.cancel();
        }
        throw QueryCancelled();
      case async::WaitStatus::TimedOut:
        // Its staging scope is dropped, so a late finish records nothing
        entry.token.cancel();
        std::cerr << "Orchestrator: tool " << entry.name << " timed out after "
                  << config_.tool_timeout.count() << " ms" << std::endl;
        outcomes.push_back(
            {entry.name,
             ToolResult::failure_response(ToolErrorKind::Timeout,
                                          "Tool '" + entry.name + "' timed out after " +
                                              std::to_string(config_.tool_timeout.count()) +
                                              " ms.")});
        continue;
      case async::WaitStatus::Ready:
        break;
    }

    ToolResult result = ToolResult::failure_response(ToolErrorKind::Failed, "");
    try {
      result = entry.future.get();
    } catch (const std::exception &e) {
      std::cerr << "Orchestrator: tool " << entry.name << " threw: " << e.what() << std::endl;
      result = ToolResult::failure_response(ToolErrorKind::Failed,
                                            "Tool '" + entry.name + "' failed: " + e.what());
    }
    request_scope.record(entry.staging->drain());
    outcomes.push_back({entry.name, std::move(result)});
  }
  return outcomes;
}

QueryResult ToolOrchestrator::query(const std::string &user_input,
                                    const async::CancellationToken &cancel) {
  std::lock_guard<std::mutex> session_lock(session_mutex_);

  const UserContext user = user_context();
  QueryScope scope;
  std::vector<ChatMessage> conversation = build_conversation(user, user_input);
  std::vector<std::string> tools_used;
  int iterations = 0;
  bool exhausted = false;
  std::string answer;
  std::string last_tool_output;

  try {
    while (true) {
      if (cancel.is_cancelled()) {
        throw QueryCancelled();
      }
      if (iterations >= config_.max_iterations) {
        exhausted = true;
        break;
      }

      ModelTurn turn = call_model(conversation, cancel);
      if (turn.is_final()) {
        answer = turn.content;
        break;
      }

      ++iterations;
      if (!turn.content.empty()) {
        answer = turn.content;
      }
      std::vector<std::string> requested;
      for (const auto &call : turn.tool_calls) {
        requested.push_back(call.name);
      }
      std::cout << "Orchestrator: iteration " << iterations << " dispatching "
                << join(requested, ", ") << std::endl;

      conversation.push_back({"assistant", describe_tool_calls(turn.tool_calls)});
      for (auto &outcome : dispatch(turn.tool_calls, scope, user, cancel)) {
        tools_used.push_back(outcome.tool_name);
        conversation.push_back({"tool", "[" + outcome.tool_name + "] " + outcome.result.output});
        last_tool_output = outcome.result.output;
      }
    }
  } catch (const QueryCancelled &) {
    scope.reset();
    std::cout << "Orchestrator: query cancelled after " << iterations << " iterations"
              << std::endl;
    QueryResult result = QueryResult::failure_response("Request cancelled.", "cancelled",
                                                       std::move(tools_used));
    result.iterations = iterations;
    return result;
  } catch (const ModelUnavailableError &e) {
    scope.reset();
    std::cerr << "Orchestrator: model unavailable: " << e.what() << std::endl;
    QueryResult result =
        QueryResult::failure_response(APOLOGY_MESSAGE, e.what(), std::move(tools_used));
    result.iterations = iterations;
    return result;
  } catch (const std::exception &e) {
    scope.reset();
    std::cerr << "Orchestrator: query failed: " << e.what() << std::endl;
    QueryResult result =
        QueryResult::failure_response(APOLOGY_MESSAGE, e.what(), std::move(tools_used));
    result.iterations = iterations;
    return result;
  }

  if (exhausted && strip_legacy_citations(answer).empty()) {
    answer = "I could not finish researching this request within " +
             std::to_string(config_.max_iterations) + " steps.";
    if (!last_tool_output.empty()) {
      answer += " Here is what I found so far:\n" + last_tool_output;
    }
  }

  ResolvedAnswer resolved = resolve_citations(answer, scope.drain());
  if (resolved.answer.empty()) {
    resolved.answer = "I'm sorry, I could not find an answer to your question.";
  }

  // A cancellation that raced the last step still leaves no trace
  if (cancel.is_cancelled()) {
    QueryResult result = QueryResult::failure_response("Request cancelled.", "cancelled",
                                                       std::move(tools_used));
    result.iterations = iterations;
    return result;
  }

  remember(user_input, resolved.answer);

  if (config_.record_chat_history && recorder_ && user.has_user()) {
    RecordResult recorded =
        recorder_->record(user_input, resolved.answer, user.user_id, user.department);
    if (!recorded.success) {
      std::cerr << "Orchestrator: chat history not recorded: " << recorded.error_message
                << std::endl;
    }
  }

  QueryResult result;
  result.response = std::move(resolved.answer);
  result.sources = std::move(resolved.sources);
  result.success = true;
  result.tools_used = std::move(tools_used);
  result.iterations = iterations;
  result.exhausted = exhausted;
  return result;
}

}  // namespace docent_core
