#include "method_handlers.h"

#include "handlers/tool_registry.h"
#include <algorithm>
#include <iostream>
#include <utility>

namespace xdmcp::mcp {

using protocol::DynamicValue;
using protocol::JsonRpcError;
using protocol::JsonRpcRequest;

namespace {

JsonRpcError invalid_params() {
  return JsonRpcError{protocol::kInvalidParams, "Invalid params", std::nullopt};
}

DynamicValue text_content(std::string text) {
  return DynamicValue::Object{
      {"content", DynamicValue::Array{DynamicValue::Object{
                      {"type", "text"},
                      {"text", std::move(text)},
                  }}},
      {"isError", false},
  };
}

}  // namespace

std::string negotiate_protocol_version(const DynamicValue* params, const ServerIdentity& identity) {
  const DynamicValue* requested = params == nullptr ? nullptr : params->find("protocolVersion");
  if (requested != nullptr && requested->is_string()) {
    const auto& supported = identity.supported_protocol_versions;
    if (std::find(supported.begin(), supported.end(), *requested->as_string()) != supported.end()) {
      return *requested->as_string();
    }
  }
  return identity.default_protocol_version;
}

MethodResult handle_initialize(const JsonRpcRequest& req, ServerContext& ctx) {
  const DynamicValue* params = req.params.has_value() ? &req.params.value() : nullptr;
  ctx.state = SessionState::kInitialized;

  return MethodResult::ok(DynamicValue::Object{
      {"protocolVersion", negotiate_protocol_version(params, ctx.identity)},
      {"capabilities", DynamicValue::Object{{"tools", DynamicValue::Object{{"listChanged", false}}}}},
      {"serverInfo",
       DynamicValue::Object{{"name", ctx.identity.name}, {"version", ctx.identity.version}}},
  });
}

MethodResult handle_tools_list(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  DynamicValue::Array tools;
  for (const auto& descriptor : handlers::tool_descriptors()) {
    tools.emplace_back(DynamicValue::Object{
        {"name", descriptor.name},
        {"description", descriptor.description},
        {"inputSchema", protocol::dynamic_value_from_json(descriptor.input_schema)},
    });
  }
  return MethodResult::ok(DynamicValue::Object{{"tools", std::move(tools)}});
}

MethodResult handle_tools_call(const JsonRpcRequest& req, ServerContext& ctx) {
  if (!req.params.has_value() || !req.params->is_object()) {
    return MethodResult::err(invalid_params());
  }
  const DynamicValue* name = req.params->find("name");
  const DynamicValue* arguments = req.params->find("arguments");
  if (name == nullptr || !name->is_string() || arguments == nullptr || !arguments->is_object()) {
    return MethodResult::err(invalid_params());
  }

  // Tool registry
  static const auto tool_registry = handlers::build_tool_registry();

  auto it = tool_registry.find(*name->as_string());
  if (it == tool_registry.end()) {
    return MethodResult::err(
        JsonRpcError{protocol::kInvalidParams, "Unknown tool: " + *name->as_string(), std::nullopt});
  }

  auto text = it->second(*arguments, ctx);
  if (!text.has_value()) {
    return MethodResult::err(text.error());
  }
  return MethodResult::ok(text_content(text.value()));
}

MethodResult handle_ping(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  return MethodResult::ok(DynamicValue::Object{});
}

std::unordered_map<std::string, MethodHandler> build_method_registry() {
  return {
      {"initialize", handle_initialize},
      {"tools/list", handle_tools_list},
      {"tools/call", handle_tools_call},
      {"ping", handle_ping},
  };
}

bool is_notification_method(const std::string& method) {
  return method == "initialized" || method.starts_with("notifications/");
}

void apply_notification(const JsonRpcRequest& req, ServerContext& ctx) {
  if (req.method == "initialize") {
    ctx.state = SessionState::kInitialized;
    return;
  }
  if (req.method == "initialized" || req.method == "notifications/initialized") {
    if (ctx.state == SessionState::kInitialized) {
      ctx.state = SessionState::kServing;
    } else if (ctx.state == SessionState::kUninitialized) {
      std::cerr << "Ignoring " << req.method << " before initialize\n";
    }
  }
}

}  // namespace xdmcp::mcp
