#include "docent_core/agent/session_registry.hpp"

#include <stdexcept>
#include <utility>

namespace docent_core {

SessionRegistry::SessionRegistry(OrchestratorFactory factory) : factory_(std::move(factory)) {
  if (!factory_) {
    throw std::invalid_argument("SessionRegistry needs an orchestrator factory");
  }
}

std::shared_ptr<ToolOrchestrator> SessionRegistry::get_or_create(const std::string &session_id,
                                                                 const UserContext &context) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it != sessions_.end()) {
    it->second->set_user_context(context);
    return it->second;
  }
  auto orchestrator = factory_(context);
  if (!orchestrator) {
    throw std::runtime_error("Orchestrator factory returned null for session " + session_id);
  }
  sessions_.emplace(session_id, orchestrator);
  return orchestrator;
}

std::shared_ptr<ToolOrchestrator> SessionRegistry::find(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  return it == sessions_.end() ? nullptr : it->second;
}

bool SessionRegistry::end_session(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.erase(session_id) > 0;
}

size_t SessionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

}  // namespace docent_core
