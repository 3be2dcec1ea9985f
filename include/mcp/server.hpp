#pragma once

#include <optional>
#include <string>

#include "mcp/jsonrpc.hpp"
#include "mcp/tools.hpp"

namespace weather_mcp::mcp {

constexpr const char* kProtocolVersion = "2024-11-05";

struct ServerInfo {
  std::string name{"weather-server"};
  std::string version{"1.0.0"};
};

// Turns one input line into at most one output line.
class MessageHandler {
 public:
  virtual ~MessageHandler() = default;

  virtual std::optional<std::string> handle(const std::string& line) const = 0;
};

// The protocol engine. Holds the tool registry and nothing else; every call to
// handle() is independent and never throws.
class Server : public MessageHandler {
 public:
  explicit Server(ToolRegistry tools, ServerInfo info = {});

  std::optional<std::string> handle(const std::string& line) const override;

  const ToolRegistry& tools() const { return tools_; }
  const ServerInfo& info() const { return info_; }

 private:
  std::optional<json> handle_request(const Request& request) const;
  json handle_initialize(const json& id) const;
  json handle_tools_list(const json& id) const;
  json handle_tools_call(const json& id, const json& params) const;

  const ToolRegistry tools_;
  const ServerInfo info_;
};

}  // namespace weather_mcp::mcp
