#pragma once

#include "xdmcp/protocol/dynamic_value.h"
#include "xdmcp/protocol/request_id.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace xdmcp::protocol {

// Error codes (JSON-RPC 2.0 reserved range)
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

constexpr const char* kJsonRpcVersion = "2.0";

struct JsonRpcError {
  int code{kInternalError};            // NOLINT(readability-identifier-naming)
  std::string message;                 // NOLINT(readability-identifier-naming)
  std::optional<DynamicValue> data;    // NOLINT(readability-identifier-naming)
};

// A request without an id is a notification and never receives a response.
struct JsonRpcRequest {
  std::string jsonrpc{kJsonRpcVersion};  // NOLINT(readability-identifier-naming)
  std::optional<RequestId> id;           // NOLINT(readability-identifier-naming)
  std::string method;                    // NOLINT(readability-identifier-naming)
  std::optional<DynamicValue> params;    // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool is_notification() const { return !id.has_value(); }
};

// Exactly one of result/error is set on every response built through success()/failure().
struct JsonRpcResponse {
  std::string jsonrpc{kJsonRpcVersion};  // NOLINT(readability-identifier-naming)
  RequestId id;                          // NOLINT(readability-identifier-naming)
  std::optional<DynamicValue> result;    // NOLINT(readability-identifier-naming)
  std::optional<JsonRpcError> error;     // NOLINT(readability-identifier-naming)

  static JsonRpcResponse success(RequestId id, DynamicValue result);
  static JsonRpcResponse failure(RequestId id, JsonRpcError error);
  static JsonRpcResponse failure(RequestId id, int code, std::string message);
};

// Decode a request object. Returns nullopt unless j is an object with "jsonrpc": "2.0", a
// string "method", and (when present) an "id" that decodes as a RequestId.
[[nodiscard]] std::optional<JsonRpcRequest> request_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json request_to_json(const JsonRpcRequest& request);

// Decode a response object. Returns nullopt unless exactly one of result/error is present.
[[nodiscard]] std::optional<JsonRpcResponse> response_from_json(const nlohmann::json& j);

// Encode a response. "id" is always written (null for NullId); "error.data" only when set.
[[nodiscard]] nlohmann::json response_to_json(const JsonRpcResponse& response);

}  // namespace xdmcp::protocol
