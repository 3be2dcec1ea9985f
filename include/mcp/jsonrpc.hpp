#pragma once

#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace weather_mcp::mcp {

using json = nlohmann::ordered_json;

constexpr const char* kJsonRpcVersion = "2.0";

enum class ErrorCode : int {
  kParseError = -32700,
  kMethodNotFound = -32601,
  kInternalError = -32603,
};

struct JsonRpcError {
  ErrorCode code;
  std::string message;
};

// An envelope carrying an id; always answered.
struct Request {
  json id;
  std::string method;
  json params;
};

// An envelope without an id; never answered.
struct Notification {
  std::string method;
  json params;
};

using Message = std::variant<Request, Notification>;

// Throws std::invalid_argument when the envelope is structurally unusable.
Message parse_message(const json& envelope);

// Id to answer a rejected envelope with. std::nullopt means the envelope was a
// notification and must stay unanswered; json null means the id is unknown.
std::optional<json> recover_id(const json& envelope);

json make_result_response(const json& id, const json& result);
json make_error_response(const json& id, const JsonRpcError& error);

std::string strip_control_characters(std::string text);

}  // namespace weather_mcp::mcp
