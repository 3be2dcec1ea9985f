#include "mcp/jsonrpc.hpp"

#include <stdexcept>
#include <utility>

namespace weather_mcp::mcp {

namespace {

bool is_valid_id(const json& id) {
  return id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

bool is_notification(const json& envelope) {
  const auto id_it = envelope.find("id");
  return id_it == envelope.end() || id_it->is_null();
}

}  // namespace

Message parse_message(const json& envelope) {
  if (!envelope.is_object()) {
    throw std::invalid_argument("request must be a JSON object");
  }

  const auto jsonrpc_it = envelope.find("jsonrpc");
  if (jsonrpc_it != envelope.end() && (!jsonrpc_it->is_string() || *jsonrpc_it != kJsonRpcVersion)) {
    throw std::invalid_argument("jsonrpc must be \"2.0\"");
  }

  // A missing or non-string method is routed like any other unknown method.
  std::string method;
  const auto method_it = envelope.find("method");
  if (method_it != envelope.end() && method_it->is_string()) {
    method = method_it->get<std::string>();
  }

  json params = json::object();
  const auto params_it = envelope.find("params");
  if (params_it != envelope.end() && !params_it->is_null()) {
    if (!params_it->is_object()) {
      throw std::invalid_argument("params must be an object");
    }
    params = *params_it;
  }

  if (is_notification(envelope)) {
    return Notification{.method = std::move(method), .params = std::move(params)};
  }

  const auto& id = envelope.at("id");
  if (!is_valid_id(id)) {
    throw std::invalid_argument("id must be a string or an integer");
  }
  return Request{.id = id, .method = std::move(method), .params = std::move(params)};
}

std::optional<json> recover_id(const json& envelope) {
  if (!envelope.is_object()) {
    return json(nullptr);
  }
  if (is_notification(envelope)) {
    return std::nullopt;
  }
  const auto& id = envelope.at("id");
  if (!is_valid_id(id)) {
    return json(nullptr);
  }
  return id;
}

json make_result_response(const json& id, const json& result) {
  return json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

json make_error_response(const json& id, const JsonRpcError& error) {
  return json{{"jsonrpc", kJsonRpcVersion},
                        {"id", id},
                        {"error",
                         {{"code", static_cast<int>(error.code)},
                          {"message", strip_control_characters(error.message)}}}};
}

std::string strip_control_characters(std::string text) {
  for (auto& c : text) {
    const auto byte = static_cast<unsigned char>(c);
    if (byte < 0x20 || byte == 0x7F) {
      c = ' ';
    }
  }
  return text;
}

}  // namespace weather_mcp::mcp
