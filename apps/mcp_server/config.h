#pragma once

#include "xdmcp/providers/symbol_graph_provider.h"

#include "shared/arg_parser.h"
#include <optional>
#include <string>
#include <vector>

namespace xdmcp::mcp {

constexpr const char* kDefaultDeveloperDir = "/Applications/Xcode.app/Contents/Developer";

// HostSettings locates the developer tools and SDK the tool bodies run against.
// Every field has an explicit default; optional fields mean "not configured".
struct HostSettings {
  // --sdk: SDK root override. When absent the SDK is resolved with xcrun on each call.
  std::optional<std::string> sdk_path;                    // NOLINT(readability-identifier-naming)
  std::string developer_dir{kDefaultDeveloperDir};        // NOLINT(readability-identifier-naming)
  std::string target{providers::kDefaultTargetTriple};    // NOLINT(readability-identifier-naming)
  // $HOME, for the per-user documentation cache. Empty when unset.
  std::string home_dir;                                   // NOLINT(readability-identifier-naming)
};

// McpServerConfig holds all parsed startup flags for the MCP server.
struct McpServerConfig {
  HostSettings host;  // NOLINT(readability-identifier-naming)
};

// host_options registers --sdk, --developer-dir and --target for any config type that
// embeds HostSettings as `host`. The developer CLI reuses them for its subcommands.
template <typename Config>
std::vector<apps::Option<Config>> host_options() {
  return {
      {"--sdk", true, "SDK root (default: xcrun --show-sdk-path)",
       [](Config& c, const std::string& v) {
         c.host.sdk_path = v;
         return true;
       }},
      {"--developer-dir", true, "Xcode developer directory",
       [](Config& c, const std::string& v) {
         c.host.developer_dir = v;
         return true;
       }},
      {"--target", true, "Target triple for symbol-graph extraction",
       [](Config& c, const std::string& v) {
         c.host.target = v;
         return true;
       }},
  };
}

// home_dir_from_environment returns $HOME, or "" when it is not set.
[[nodiscard]] std::string home_dir_from_environment();

McpServerConfig parse_args(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

}  // namespace xdmcp::mcp
