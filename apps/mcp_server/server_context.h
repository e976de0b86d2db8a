#pragma once

#include "xdmcp/core/services.h"
#include "xdmcp/core/version.h"

#include "config.h"
#include <string>
#include <vector>

namespace xdmcp::mcp {

// Session lifecycle. initialize moves to kInitialized (from any state, so clients may
// re-initialize); the initialized notification moves kInitialized to kServing.
// Tool calls are accepted in every state.
enum class SessionState {
  kUninitialized,  // NOLINT(readability-identifier-naming)
  kInitialized,    // NOLINT(readability-identifier-naming)
  kServing,        // NOLINT(readability-identifier-naming)
};

// ServerIdentity is built once in main() and never changes.
struct ServerIdentity {
  std::string name;                                      // NOLINT(readability-identifier-naming)
  std::string version;                                   // NOLINT(readability-identifier-naming)
  std::string default_protocol_version;                  // NOLINT(readability-identifier-naming)
  std::vector<std::string> supported_protocol_versions;  // NOLINT(readability-identifier-naming)
};

inline ServerIdentity default_server_identity() {
  return ServerIdentity{
      .name = core::kServerName,
      .version = core::kBuildVersion,
      .default_protocol_version = "2025-06-18",
      .supported_protocol_versions = {"2024-11-05", "2025-03-26", "2025-06-18"},
  };
}

// ServerContext holds all process-lifetime references passed to every method and tool
// handler, plus the session state. All references must remain valid for the lifetime of
// run_server_loop().
struct ServerContext {
  const core::Services& services;    // NOLINT(readability-identifier-naming)
  const McpServerConfig& config;     // NOLINT(readability-identifier-naming)
  const ServerIdentity& identity;    // NOLINT(readability-identifier-naming)
  SessionState state{SessionState::kUninitialized};  // NOLINT(readability-identifier-naming)
};

}  // namespace xdmcp::mcp
