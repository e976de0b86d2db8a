#include "xdmcp/protocol/messages.h"

#include <utility>

namespace xdmcp::protocol {

JsonRpcResponse JsonRpcResponse::success(RequestId id, DynamicValue result) {
  JsonRpcResponse response;
  response.id = std::move(id);
  response.result = std::move(result);
  return response;
}

JsonRpcResponse JsonRpcResponse::failure(RequestId id, JsonRpcError error) {
  JsonRpcResponse response;
  response.id = std::move(id);
  response.error = std::move(error);
  return response;
}

JsonRpcResponse JsonRpcResponse::failure(RequestId id, int code, std::string message) {
  return failure(std::move(id), JsonRpcError{code, std::move(message), std::nullopt});
}

std::optional<JsonRpcRequest> request_from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    return std::nullopt;
  }

  auto version = j.find("jsonrpc");
  if (version == j.end() || !version->is_string() ||
      version->get<std::string>() != kJsonRpcVersion) {
    return std::nullopt;
  }

  auto method = j.find("method");
  if (method == j.end() || !method->is_string()) {
    return std::nullopt;
  }

  JsonRpcRequest request;
  request.method = method->get<std::string>();

  // An explicit "id": null is a request with the null id, not a notification.
  if (auto id = j.find("id"); id != j.end()) {
    auto decoded = request_id_from_json(*id);
    if (!decoded.has_value()) {
      return std::nullopt;
    }
    request.id = std::move(decoded);
  }

  if (auto params = j.find("params"); params != j.end()) {
    request.params = dynamic_value_from_json(*params);
  }

  return request;
}

nlohmann::json request_to_json(const JsonRpcRequest& request) {
  nlohmann::json j;
  j["jsonrpc"] = request.jsonrpc;
  if (request.id.has_value()) {
    j["id"] = request_id_to_json(request.id.value());
  }
  j["method"] = request.method;
  if (request.params.has_value()) {
    j["params"] = dynamic_value_to_json(request.params.value());
  }
  return j;
}

namespace {

std::optional<JsonRpcError> error_from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    return std::nullopt;
  }
  auto code = j.find("code");
  auto message = j.find("message");
  if (code == j.end() || !code->is_number_integer() || message == j.end() ||
      !message->is_string()) {
    return std::nullopt;
  }

  JsonRpcError error;
  error.code = code->get<int>();
  error.message = message->get<std::string>();
  if (auto data = j.find("data"); data != j.end()) {
    error.data = dynamic_value_from_json(*data);
  }
  return error;
}

}  // namespace

std::optional<JsonRpcResponse> response_from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    return std::nullopt;
  }

  JsonRpcResponse response;
  if (auto id = j.find("id"); id != j.end()) {
    auto decoded = request_id_from_json(*id);
    if (!decoded.has_value()) {
      return std::nullopt;
    }
    response.id = decoded.value();
  }

  auto result = j.find("result");
  auto error = j.find("error");
  const bool has_result = result != j.end();
  const bool has_error = error != j.end();
  if (has_result == has_error) {
    return std::nullopt;
  }

  if (has_result) {
    response.result = dynamic_value_from_json(*result);
  } else {
    auto decoded = error_from_json(*error);
    if (!decoded.has_value()) {
      return std::nullopt;
    }
    response.error = std::move(decoded);
  }

  return response;
}

nlohmann::json response_to_json(const JsonRpcResponse& response) {
  nlohmann::json j;
  j["jsonrpc"] = response.jsonrpc;
  j["id"] = request_id_to_json(response.id);

  if (response.error.has_value()) {
    const auto& error = response.error.value();
    nlohmann::json error_json{
        {"code", error.code},
        {"message", error.message},
    };
    if (error.data.has_value()) {
      error_json["data"] = dynamic_value_to_json(error.data.value());
    }
    j["error"] = std::move(error_json);
  } else {
    j["result"] = response.result.has_value() ? dynamic_value_to_json(response.result.value())
                                              : nlohmann::json::object();
  }

  return j;
}

}  // namespace xdmcp::protocol
