#include "mcp/tools.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace weather_mcp::mcp {

void ToolRegistry::add(Tool tool) {
  if (tool.name.empty()) {
    throw std::invalid_argument("tool name must not be empty");
  }
  if (!tool.handler) {
    throw std::invalid_argument("tool " + tool.name + " has no handler");
  }
  if (find(tool.name) != nullptr) {
    throw std::invalid_argument("duplicate tool name: " + tool.name);
  }
  tools_.push_back(std::move(tool));
}

const Tool* ToolRegistry::find(std::string_view name) const {
  const auto it = std::find_if(tools_.begin(), tools_.end(), [name](const Tool& tool) { return tool.name == name; });
  return it == tools_.end() ? nullptr : &*it;
}

json ToolRegistry::describe() const {
  json tools = json::array();
  for (const auto& tool : tools_) {
    tools.push_back({{"name", tool.name}, {"description", tool.description}, {"inputSchema", tool.input_schema}});
  }
  return tools;
}

}  // namespace weather_mcp::mcp
