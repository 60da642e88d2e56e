#pragma once

#include <memory>

#include "docent_core/agent/tool.hpp"
#include "docent_core/portal/user_data_portal.hpp"

namespace docent_core {

// "fetch_user_data": personalised records from the internal portal. Needs
// the caller's credential.
class UserDataTool : public Tool {
 public:
  static constexpr const char *NAME = "fetch_user_data";

  explicit UserDataTool(std::shared_ptr<UserDataPortal> portal);

  std::string name() const override {
    return NAME;
  }
  ToolSpec spec() const override;
  ToolResult invoke(const nlohmann::json &arguments, const ToolContext &context) override;

 private:
  std::shared_ptr<UserDataPortal> portal_;
};

}  // namespace docent_core
