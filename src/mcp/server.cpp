#include "mcp/server.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace weather_mcp::mcp {

namespace {

constexpr const char* kSerializationFailure = "Internal error: failed to serialize response";

std::string serialize(const json& id, const json& response) {
  try {
    return response.dump();
  } catch (const json::exception&) {
    return make_error_response(id, JsonRpcError{.code = ErrorCode::kInternalError, .message = kSerializationFailure})
        .dump(-1, ' ', false, json::error_handler_t::replace);
  }
}

std::string internal_error(const json& id, const std::string& detail) {
  return serialize(id, make_error_response(id, JsonRpcError{.code = ErrorCode::kInternalError,
                                                            .message = "Internal error: " + detail}));
}

}  // namespace

Server::Server(ToolRegistry tools, ServerInfo info) : tools_(std::move(tools)), info_(std::move(info)) {}

std::optional<std::string> Server::handle(const std::string& line) const {
  json envelope;
  try {
    envelope = json::parse(line);
  } catch (const json::parse_error&) {
    return serialize(nullptr, make_error_response(nullptr, JsonRpcError{.code = ErrorCode::kParseError,
                                                                        .message = "Parse error"}));
  }

  Message message;
  try {
    message = parse_message(envelope);
  } catch (const std::invalid_argument& ex) {
    const auto id = recover_id(envelope);
    if (!id.has_value()) {
      return std::nullopt;
    }
    return internal_error(*id, ex.what());
  }

  if (std::holds_alternative<Notification>(message)) {
    return std::nullopt;
  }

  const auto& request = std::get<Request>(message);
  try {
    const auto response = handle_request(request);
    if (!response.has_value()) {
      return std::nullopt;
    }
    return serialize(request.id, *response);
  } catch (const std::exception& ex) {
    return internal_error(request.id, ex.what());
  }
}

std::optional<json> Server::handle_request(const Request& request) const {
  if (request.method == "initialize") {
    return handle_initialize(request.id);
  }
  if (request.method == "notifications/initialized") {
    return std::nullopt;
  }
  if (request.method == "tools/list") {
    return handle_tools_list(request.id);
  }
  if (request.method == "tools/call") {
    return handle_tools_call(request.id, request.params);
  }
  if (request.method == "ping") {
    return make_result_response(request.id, json::object());
  }

  return make_error_response(request.id, JsonRpcError{.code = ErrorCode::kMethodNotFound,
                                                      .message = "Unknown method: " + request.method});
}

json Server::handle_initialize(const json& id) const {
  return make_result_response(id, json{{"protocolVersion", kProtocolVersion},
                                       {"capabilities", {{"tools", json::object()}}},
                                       {"serverInfo", {{"name", info_.name}, {"version", info_.version}}}});
}

json Server::handle_tools_list(const json& id) const {
  return make_result_response(id, json{{"tools", tools_.describe()}});
}

json Server::handle_tools_call(const json& id, const json& params) const {
  std::string name;
  const auto name_it = params.find("name");
  if (name_it != params.end() && name_it->is_string()) {
    name = name_it->get<std::string>();
  }

  const auto* tool = tools_.find(name);
  if (tool == nullptr) {
    return make_error_response(id, JsonRpcError{.code = ErrorCode::kMethodNotFound, .message = "Unknown tool: " + name});
  }

  json arguments = json::object();
  const auto args_it = params.find("arguments");
  if (args_it != params.end() && !args_it->is_null()) {
    if (!args_it->is_object()) {
      throw std::invalid_argument("arguments must be an object");
    }
    arguments = *args_it;
  }

  ToolResult outcome;
  try {
    outcome = tool->handler(arguments);
  } catch (const std::exception& ex) {
    outcome = ToolFailure{.message = ex.what()};
  }

  if (const auto* failure = std::get_if<ToolFailure>(&outcome)) {
    return make_error_response(id, JsonRpcError{.code = ErrorCode::kInternalError,
                                                .message = "Tool execution error: " + failure->message});
  }

  return make_result_response(
      id, json{{"content", json::array({{{"type", "text"}, {"text", std::get<std::string>(outcome)}}})}});
}

}  // namespace weather_mcp::mcp
