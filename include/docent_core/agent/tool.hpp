#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "docent_core/agent/user_context.hpp"
#include "docent_core/async/cancellation_token.hpp"
#include "docent_core/llm/chat_model.hpp"
#include "docent_core/provenance/query_scope.hpp"

namespace docent_core {

enum class ToolErrorKind {
  InvalidArguments,
  AuthenticationRequired,
  PortalUnavailable,
  Timeout,
  Cancelled,
  UnknownTool,
  Failed
};

std::string to_string(ToolErrorKind kind);

// Outcome of one tool call. The output is what the model gets to read, for
// failures as well as successes.
struct ToolResult {
  bool success;
  std::string output;
  std::optional<ToolErrorKind> error;

  static ToolResult success_response(const std::string &output) {
    return {true, output, std::nullopt};
  }

  static ToolResult failure_response(ToolErrorKind kind, const std::string &output) {
    return {false, output, kind};
  }
};

// Everything a tool may touch besides its arguments.
struct ToolContext {
  // Provenance sink for this call only
  std::shared_ptr<QueryScope> scope;
  UserContext user;
  async::CancellationToken cancel;
};

class Tool {
 public:
  virtual ~Tool() = default;

  virtual std::string name() const = 0;
  virtual ToolSpec spec() const = 0;

  // Tool-level problems are reported through the result; an exception
  // escaping here is turned into a Failed result by the caller.
  virtual ToolResult invoke(const nlohmann::json &arguments, const ToolContext &context) = 0;

 protected:
  // String argument, or nullopt when absent, null or empty
  static std::optional<std::string> string_argument(const nlohmann::json &arguments,
                                                    const std::string &key);
};

using ToolPtr = std::shared_ptr<Tool>;

}  // namespace docent_core
