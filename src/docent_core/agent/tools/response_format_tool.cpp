#include "docent_core/agent/tools/response_format_tool.hpp"

namespace docent_core {

ToolSpec ResponseFormatTool::spec() const {
  return ToolSpec{
      .name = NAME,
      .description = "Format data into a structured API response format.",
      .parameters = {{"type", "object"},
                     {"properties",
                      {{"data", {{"type", "object"}, {"description", "The data to format"}}}}},
                     {"required", nlohmann::json::array({"data"})}}};
}

ToolResult ResponseFormatTool::invoke(const nlohmann::json &arguments,
                                      const ToolContext & /*context*/) {
  // Models sometimes pass the payload directly instead of under "data"
  const nlohmann::json &data =
      arguments.is_object() && arguments.contains("data") ? arguments["data"] : arguments;
  try {
    return ToolResult::success_response(data.dump(2));
  } catch (const nlohmann::json::type_error &e) {
    // Invalid UTF-8 inside string values
    return ToolResult::failure_response(ToolErrorKind::InvalidArguments,
                                        "Error formatting response: " + std::string(e.what()));
  }
}

}  // namespace docent_core
