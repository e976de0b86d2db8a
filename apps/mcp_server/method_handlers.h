#pragma once

#include "xdmcp/core/result.h"
#include "xdmcp/protocol/dynamic_value.h"
#include "xdmcp/protocol/messages.h"

#include "server_context.h"
#include <functional>
#include <string>
#include <unordered_map>

namespace xdmcp::mcp {

using MethodResult = core::Result<protocol::DynamicValue, protocol::JsonRpcError>;
using MethodHandler =
    std::function<MethodResult(const protocol::JsonRpcRequest& req, ServerContext& ctx)>;

MethodResult handle_initialize(const protocol::JsonRpcRequest& req, ServerContext& ctx);
MethodResult handle_tools_list(const protocol::JsonRpcRequest& req, ServerContext& ctx);
MethodResult handle_tools_call(const protocol::JsonRpcRequest& req, ServerContext& ctx);
MethodResult handle_ping(const protocol::JsonRpcRequest& req, ServerContext& ctx);

std::unordered_map<std::string, MethodHandler> build_method_registry();

// is_notification_method: "initialized" and every "notifications/..." method. These are
// never answered, even when the client attaches an id.
[[nodiscard]] bool is_notification_method(const std::string& method);

// apply_notification performs the session-state effect of a message that gets no
// response. Tool bodies never run here.
void apply_notification(const protocol::JsonRpcRequest& req, ServerContext& ctx);

// negotiate_protocol_version echoes requested when it is supported, else the default.
[[nodiscard]] std::string negotiate_protocol_version(const protocol::DynamicValue* params,
                                                     const ServerIdentity& identity);

}  // namespace xdmcp::mcp
