#include "startup_guard.h"

namespace xdmcp::mcp {

namespace {

bool is_absolute(const std::string& path) {
  return !path.empty() && path.front() == '/';
}

}  // namespace

std::string validate_host_settings(const HostSettings& host) {
  if (host.sdk_path.has_value() && !is_absolute(host.sdk_path.value())) {
    return "Error: --sdk '" + host.sdk_path.value() +
           "' must be an absolute path.\n"
           "       Omit --sdk to resolve the SDK with xcrun --show-sdk-path.";
  }

  if (!is_absolute(host.developer_dir)) {
    return "Error: --developer-dir '" + host.developer_dir + "' must be an absolute path.";
  }

  if (host.target.empty()) {
    return "Error: --target must not be empty (e.g. arm64-apple-macos15.0).";
  }

  return "";
}

std::string validate_mcp_server_config(const McpServerConfig& config) {
  return validate_host_settings(config.host);
}

}  // namespace xdmcp::mcp
