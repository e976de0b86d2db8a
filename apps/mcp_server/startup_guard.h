#pragma once

#include "config.h"
#include <string>

namespace xdmcp::mcp {

// validate_host_settings checks the SDK/toolchain flags.
//
// Returns: "" on success, non-empty error message on failure.
//
// Preconditions checked (first failure is returned):
// - --sdk, when given, is an absolute path
// - --developer-dir is an absolute path
// - --target is non-empty
[[nodiscard]] std::string validate_host_settings(const HostSettings& host);

// validate_mcp_server_config checks startup preconditions for the MCP server.
// Caller is responsible for printing the error and exiting with code 1.
[[nodiscard]] std::string validate_mcp_server_config(const McpServerConfig& config);

}  // namespace xdmcp::mcp
