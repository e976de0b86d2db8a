#include "config.h"

#include <cstdlib>
#include <utility>

namespace xdmcp::mcp {

std::string home_dir_from_environment() {
  const char* home = std::getenv("HOME");  // NOLINT(concurrency-mt-unsafe)
  return home == nullptr ? std::string{} : std::string{home};
}

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

McpServerConfig parse_args(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  McpServerConfig defaults;
  defaults.host.home_dir = home_dir_from_environment();
  return apps::parse_options(argc, argv, host_options<McpServerConfig>(), 1, std::move(defaults));
}

}  // namespace xdmcp::mcp
