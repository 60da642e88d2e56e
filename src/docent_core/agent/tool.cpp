#include "docent_core/agent/tool.hpp"

namespace docent_core {

std::string to_string(ToolErrorKind kind) {
  switch (kind) {
    case ToolErrorKind::InvalidArguments:
      return "InvalidArguments";
    case ToolErrorKind::AuthenticationRequired:
      return "AuthenticationRequired";
    case ToolErrorKind::PortalUnavailable:
      return "PortalUnavailable";
    case ToolErrorKind::Timeout:
      return "Timeout";
    case ToolErrorKind::Cancelled:
      return "Cancelled";
    case ToolErrorKind::UnknownTool:
      return "UnknownTool";
    case ToolErrorKind::Failed:
      return "Failed";
    default:
      return "Unknown";
  }
}

std::optional<std::string> Tool::string_argument(const nlohmann::json &arguments,
                                                 const std::string &key) {
  if (!arguments.is_object()) {
    return std::nullopt;
  }
  auto it = arguments.find(key);
  if (it == arguments.end() || !it->is_string()) {
    return std::nullopt;
  }
  std::string value = it->get<std::string>();
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace docent_core
