#include "xdmcp/search/documentation_search.h"

#include "config.h"
#include "host_stack.h"
#include "server_context.h"
#include "server_loop.h"
#include "startup_guard.h"
#include <iostream>
#include <string>

using namespace xdmcp;

// ────────────────────────────────────────────────────────────────
// Main
// ────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
  const auto config = mcp::parse_args(argc, argv);

  // Validate config before emitting any startup output so no partial messages appear on error.
  const std::string config_error = mcp::validate_mcp_server_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  const mcp::ServerIdentity identity = mcp::default_server_identity();
  mcp::HostStack host(config.host);

  // ── Startup diagnostic block ──────────────────────────────────────────────
  // stdout carries protocol responses only; everything else goes to stderr.
  std::cerr << identity.name << " MCP Server v" << identity.version << "\n";
  if (config.host.sdk_path.has_value()) {
    std::cerr << "SDK:         " << config.host.sdk_path.value() << " (--sdk)\n";
  } else {
    std::cerr << "SDK:         " << host.services().sdk_locator.sdk_root()
              << " (xcrun --show-sdk-path)\n";
  }
  std::cerr << "Target:      " << config.host.target << "\n";
  for (const auto& root :
       search::documentation_roots(config.host.home_dir, config.host.developer_dir)) {
    const bool present = host.services().file_system.exists(root);
    std::cerr << "Docs root:   " << root << (present ? "" : " (missing, skipped)") << "\n";
  }
  std::cerr << "Listening on stdio for JSON-RPC requests...\n";
  // ─────────────────────────────────────────────────────────────────────────

  mcp::ServerContext ctx{host.services(), config, identity};
  mcp::run_server_loop(ctx, std::cin, std::cout);

  return 0;
}
