#include "docent_core/agent/tool_registry.hpp"

#include <stdexcept>
#include <utility>

namespace docent_core {

void ToolRegistry::register_tool(ToolPtr tool) {
  if (!tool) {
    throw std::invalid_argument("Cannot register a null tool");
  }
  const std::string name = tool->name();
  if (by_name_.count(name) > 0) {
    throw std::invalid_argument("Tool already registered: " + name);
  }
  by_name_[name] = tool;
  tools_.push_back(std::move(tool));
}

ToolPtr ToolRegistry::find(const std::string &name) const {
  auto it = by_name_.find(name);
  return it == by_name_.end() ? nullptr : it->second;
}

std::vector<ToolSpec> ToolRegistry::specs() const {
  std::vector<ToolSpec> specs;
  specs.reserve(tools_.size());
  for (const auto &tool : tools_) {
    specs.push_back(tool->spec());
  }
  return specs;
}

std::vector<std::string> ToolRegistry::names() const {
  std::vector<std::string> names;
  names.reserve(tools_.size());
  for (const auto &tool : tools_) {
    names.push_back(tool->name());
  }
  return names;
}

}  // namespace docent_core
