#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "docent_core/agent/tool.hpp"

namespace docent_core {

// The fixed tool catalog offered to the model, looked up by name.
class ToolRegistry {
 public:
  ToolRegistry() = default;

  ToolRegistry(const ToolRegistry &) = delete;
  ToolRegistry &operator=(const ToolRegistry &) = delete;

  // Throws std::invalid_argument if a tool with the same name exists.
  void register_tool(ToolPtr tool);

  // nullptr for unknown names
  ToolPtr find(const std::string &name) const;

  // Specs in registration order
  std::vector<ToolSpec> specs() const;
  std::vector<std::string> names() const;

 private:
  std::vector<ToolPtr> tools_;
  std::map<std::string, ToolPtr> by_name_;
};

}  // namespace docent_core
