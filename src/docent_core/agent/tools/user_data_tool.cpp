#include "docent_core/agent/tools/user_data_tool.hpp"

#include <iostream>
#include <utility>

namespace docent_core {

UserDataTool::UserDataTool(std::shared_ptr<UserDataPortal> portal) : portal_(std::move(portal)) {}

ToolSpec UserDataTool::spec() const {
  return ToolSpec{
      .name = NAME,
      .description = "Fetch personalized user data like marks, attendance, or profile "
                     "information. Requires authentication.",
      .parameters = {{"type", "object"},
                     {"properties",
                      {{"data_type",
                        {{"type", "string"},
                         {"description", "Record type, e.g. marks, attendance or profile"}}},
                       {"user_id",
                        {{"type", "string"},
                         {"description", "Defaults to the current user"}}}}},
                     {"required", nlohmann::json::array({"data_type"})}}};
}

ToolResult UserDataTool::invoke(const nlohmann::json &arguments, const ToolContext &context) {
  if (!context.user.credential) {
    return ToolResult::failure_response(
        ToolErrorKind::AuthenticationRequired,
        "Authentication required to access personalized data. Please provide valid credentials.");
  }
  if (!portal_ || !portal_->is_configured()) {
    return ToolResult::failure_response(ToolErrorKind::PortalUnavailable,
                                        "Internal portal integration not configured.");
  }

  const auto data_type = string_argument(arguments, "data_type");
  if (!data_type) {
    return ToolResult::failure_response(ToolErrorKind::InvalidArguments,
                                        "fetch_user_data needs a non-empty 'data_type' argument.");
  }
  const std::string user_id = string_argument(arguments, "user_id").value_or(context.user.user_id);
  if (user_id.empty()) {
    return ToolResult::failure_response(ToolErrorKind::InvalidArguments,
                                        "fetch_user_data needs a 'user_id' for anonymous callers.");
  }

  try {
    const nlohmann::json record =
        portal_->fetch(user_id, *data_type, *context.user.credential, context.cancel);
    return ToolResult::success_response("User data retrieved:\n" + record.dump(2));
  } catch (const PortalError &e) {
    switch (e.kind()) {
      case PortalErrorKind::Unauthorized:
        return ToolResult::failure_response(
            ToolErrorKind::AuthenticationRequired,
            "Authentication required to access personalized data. Please provide valid "
            "credentials.");
      case PortalErrorKind::NotFound:
        return ToolResult::failure_response(ToolErrorKind::Failed, e.what());
      case PortalErrorKind::Cancelled:
        return ToolResult::failure_response(ToolErrorKind::Cancelled, "Request cancelled.");
      case PortalErrorKind::Unavailable:
      default:
        std::cerr << "fetch_user_data: portal unavailable: " << e.what() << std::endl;
        return ToolResult::failure_response(ToolErrorKind::PortalUnavailable,
                                            "Error fetching user data: internal portal is "
                                            "unavailable.");
    }
  }
}

}  // namespace docent_core
