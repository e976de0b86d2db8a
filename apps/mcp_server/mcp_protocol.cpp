#include "mcp_protocol.h"

#include "method_handlers.h"
#include <exception>
#include <iostream>
#include <type_traits>
#include <utility>

namespace xdmcp::mcp {

using json = nlohmann::json;
using protocol::JsonRpcRequest;
using protocol::JsonRpcResponse;
using protocol::RequestId;

namespace {

JsonRpcResponse invalid_request() {
  return JsonRpcResponse::failure(RequestId::null(), protocol::kInvalidRequest, "Invalid Request");
}

std::string dump_line(const json& value) {
  return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<JsonRpcResponse> dispatch(const JsonRpcRequest& request, ServerContext& ctx) {
  std::cerr << "Received: " << request.method << "\n";

  if (request.is_notification() || is_notification_method(request.method)) {
    apply_notification(request, ctx);
    return std::nullopt;
  }

  static const auto method_registry = build_method_registry();
  auto it = method_registry.find(request.method);
  if (it == method_registry.end()) {
    return JsonRpcResponse::failure(*request.id, protocol::kMethodNotFound,
                                    "Method not found: " + request.method);
  }

  try {
    auto result = it->second(request, ctx);
    if (!result.has_value()) {
      return JsonRpcResponse::failure(*request.id, result.error());
    }
    return JsonRpcResponse::success(*request.id, result.value());
  } catch (const std::exception& e) {
    std::cerr << "Handler for " << request.method << " failed: " << e.what() << "\n";
    return JsonRpcResponse::failure(*request.id, protocol::kInternalError,
                                    std::string{"Internal error: "} + e.what());
  }
}

}  // namespace

std::optional<JsonRpcResponse> process_message(const json& message, ServerContext& ctx) {
  auto request = protocol::request_from_json(message);
  if (!request.has_value()) {
    return invalid_request();
  }
  return dispatch(request.value(), ctx);
}

LineOutcome process_line(const std::string& line, ServerContext& ctx) {
  bool too_deep = false;
  const json::parser_callback_t depth_guard = [&too_deep](int depth, json::parse_event_t event,
                                                          json& /*parsed*/) {
    if ((event == json::parse_event_t::object_start || event == json::parse_event_t::array_start) &&
        depth >= kMaxNestingDepth) {
      too_deep = true;
    }
    return !too_deep;
  };

  json parsed;
  try {
    parsed = json::parse(line, depth_guard);
  } catch (const json::parse_error&) {
    return JsonRpcResponse::failure(RequestId::null(), protocol::kParseError, "Parse error");
  }
  if (too_deep) {
    std::cerr << "Rejected input nested deeper than " << kMaxNestingDepth << " levels\n";
    return JsonRpcResponse::failure(RequestId::null(), protocol::kParseError, "Parse error");
  }

  if (parsed.is_array()) {
    if (parsed.empty()) {
      return invalid_request();
    }
    std::vector<JsonRpcResponse> responses;
    for (const auto& element : parsed) {
      if (auto response = process_message(element, ctx)) {
        responses.push_back(std::move(*response));
      }
    }
    return responses;
  }

  if (auto response = process_message(parsed, ctx)) {
    return std::move(*response);
  }
  return NoResponse{};
}

std::optional<std::string> render_outcome(const LineOutcome& outcome) {
  return std::visit(
      [](const auto& value) -> std::optional<std::string> {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, NoResponse>) {
          return std::nullopt;
        } else if constexpr (std::is_same_v<T, JsonRpcResponse>) {
          return dump_line(protocol::response_to_json(value));
        } else {
          if (value.empty()) {
            return std::nullopt;
          }
          json batch = json::array();
          for (const auto& response : value) {
            batch.push_back(protocol::response_to_json(response));
          }
          return dump_line(batch);
        }
      },
      outcome);
}

}  // namespace xdmcp::mcp
