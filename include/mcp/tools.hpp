#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "mcp/jsonrpc.hpp"

namespace weather_mcp::mcp {

struct ToolFailure {
  std::string message;
};

using ToolResult = std::variant<std::string, ToolFailure>;

struct Tool {
  std::string name;
  std::string description;
  json input_schema;
  std::function<ToolResult(const json&)> handler;
};

// Tools in registration order. Names are unique.
class ToolRegistry {
 public:
  // Throws std::invalid_argument on an empty or duplicate name, or a missing handler.
  void add(Tool tool);

  const Tool* find(std::string_view name) const;
  const std::vector<Tool>& tools() const { return tools_; }
  std::size_t size() const { return tools_.size(); }

  // The tools/list payload.
  json describe() const;

 private:
  std::vector<Tool> tools_;
};

}  // namespace weather_mcp::mcp
