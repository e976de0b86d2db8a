#include "tool_commands.h"

#include "xdmcp/search/documentation_search.h"
#include "xdmcp/symbols/module_symbols.h"

#include "mcp_server/config.h"
#include "mcp_server/host_stack.h"
#include "mcp_server/startup_guard.h"
#include "shared/arg_parser.h"
#include "tool_commands_logic.h"
#include <charconv>
#include <cstddef>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace {

using xdmcp::apps::Option;
using xdmcp::mcp::HostSettings;

struct SearchCliConfig {
  HostSettings host;
  std::size_t limit{xdmcp::search::kDefaultSearchLimit};
  bool limit_valid{true};
};

struct SymbolsCliConfig {
  HostSettings host;
  std::string kind{xdmcp::symbols::kAllKinds};
};

struct FrameworksCliConfig {
  HostSettings host;
  std::string filter;
};

struct SymbolCliConfig {
  HostSettings host;
};

// Parse argv[2..] with the host flags plus extra, collecting positional arguments.
template <typename Config>
Config parse_command(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                     std::vector<Option<Config>> extra, std::vector<std::string>& positionals,
                     std::vector<Option<Config>>& all_options) {
  all_options = xdmcp::mcp::host_options<Config>();
  for (auto& opt : extra) {
    all_options.push_back(std::move(opt));
  }
  Config defaults;
  defaults.host.home_dir = xdmcp::mcp::home_dir_from_environment();
  return xdmcp::apps::parse_options(argc, argv, all_options, 2, std::move(defaults),
                                    &positionals);
}

// Print the validation error, if any. Returns false when the command must stop.
bool host_settings_ok(const HostSettings& host) {
  const std::string error = xdmcp::mcp::validate_host_settings(host);
  if (!error.empty()) {
    std::cerr << error << "\n";
    return false;
  }
  return true;
}

}  // namespace

int cmd_search(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<std::string> positionals;
  std::vector<Option<SearchCliConfig>> options;
  const auto config = parse_command<SearchCliConfig>(
      argc, argv,
      {{"--limit", true, "Maximum number of results (default: 20)",
        [](SearchCliConfig& c, const std::string& v) {
          long long parsed = 0;
          const auto [end, ec] = std::from_chars(v.data(), v.data() + v.size(), parsed);
          if (ec == std::errc{} && end == v.data() + v.size() && parsed > 0) {
            c.limit = static_cast<std::size_t>(parsed);
            return true;
          }
          std::cerr << "Invalid --limit: " << v << " (must be a positive integer)\n";
          c.limit_valid = false;
          return false;
        }}},
      positionals, options);

  if (!config.limit_valid || positionals.size() != 1 || positionals[0].empty()) {
    xdmcp::apps::print_usage(std::cerr, "xdmcp_cli search <query> [options]", options);
    return 1;
  }
  if (!host_settings_ok(config.host)) {
    return 1;
  }

  const xdmcp::mcp::HostStack stack(config.host);
  return execute_search(
      positionals[0], config.limit,
      xdmcp::search::documentation_roots(config.host.home_dir, config.host.developer_dir),
      stack.services(), std::cout);
}

int cmd_symbol(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<std::string> positionals;
  std::vector<Option<SymbolCliConfig>> options;
  const auto config = parse_command<SymbolCliConfig>(argc, argv, {}, positionals, options);

  if (positionals.size() != 2 || positionals[0].empty() || positionals[1].empty()) {
    xdmcp::apps::print_usage(std::cerr, "xdmcp_cli symbol <module> <symbol> [options]", options);
    return 1;
  }
  if (!host_settings_ok(config.host)) {
    return 1;
  }

  const xdmcp::mcp::HostStack stack(config.host);
  return execute_symbol(positionals[0], positionals[1], stack.services(), std::cout);
}

int cmd_frameworks(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<std::string> positionals;
  std::vector<Option<FrameworksCliConfig>> options;
  const auto config = parse_command<FrameworksCliConfig>(
      argc, argv,
      {{"--filter", true, "Keep frameworks whose name contains this text (case-insensitive)",
        [](FrameworksCliConfig& c, const std::string& v) {
          c.filter = v;
          return true;
        }}},
      positionals, options);

  if (!positionals.empty()) {
    xdmcp::apps::print_usage(std::cerr, "xdmcp_cli frameworks [options]", options);
    return 1;
  }
  if (!host_settings_ok(config.host)) {
    return 1;
  }

  const xdmcp::mcp::HostStack stack(config.host);
  return execute_frameworks(config.filter, stack.services(), std::cout);
}

int cmd_symbols(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<std::string> positionals;
  std::vector<Option<SymbolsCliConfig>> options;
  const auto config = parse_command<SymbolsCliConfig>(
      argc, argv,
      {{"--kind", true, "struct, class, enum, protocol, func, var, typealias, other or all",
        [](SymbolsCliConfig& c, const std::string& v) {
          c.kind = v;
          return true;
        }}},
      positionals, options);

  if (positionals.size() != 1 || positionals[0].empty()) {
    xdmcp::apps::print_usage(std::cerr, "xdmcp_cli symbols <module> [options]", options);
    return 1;
  }
  if (!host_settings_ok(config.host)) {
    return 1;
  }

  const xdmcp::mcp::HostStack stack(config.host);
  return execute_symbols(positionals[0], config.kind, stack.services(), std::cout);
}
