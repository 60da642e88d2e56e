#pragma once

#include "docent_core/agent/tool.hpp"

namespace docent_core {

// "create_api_response": renders structured data as indented JSON text.
class ResponseFormatTool : public Tool {
 public:
  static constexpr const char *NAME = "create_api_response";

  std::string name() const override {
    return NAME;
  }
  ToolSpec spec() const override;
  ToolResult invoke(const nlohmann::json &arguments, const ToolContext &context) override;
};

}  // namespace docent_core
