#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "docent_core/agent/tool_orchestrator.hpp"
#include "docent_core/agent/user_context.hpp"

namespace docent_core {

using OrchestratorFactory =
    std::function<std::shared_ptr<ToolOrchestrator>(const UserContext &context)>;

// One orchestrator, and therefore one memory window, per session id.
class SessionRegistry {
 public:
  explicit SessionRegistry(OrchestratorFactory factory);

  SessionRegistry(const SessionRegistry &) = delete;
  SessionRegistry &operator=(const SessionRegistry &) = delete;

  // Returns the session's orchestrator, creating it with `context` on first
  // use. An existing session takes on `context`, so queries always run as the
  // caller's user.
  std::shared_ptr<ToolOrchestrator> get_or_create(const std::string &session_id,
                                                  const UserContext &context);

  std::shared_ptr<ToolOrchestrator> find(const std::string &session_id) const;

  // Returns false if the session did not exist
  bool end_session(const std::string &session_id);

  size_t size() const;

 private:
  OrchestratorFactory factory_;
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<ToolOrchestrator>> sessions_;
};

}  // namespace docent_core
