#include "xdmcp/core/version.h"

#include "commands/tool_commands.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "xcode-docs-mcp developer CLI v" << xdmcp::core::kBuildVersion << "\n"
            << "Usage: xdmcp_cli <command> [options]\n"
            << "Commands:\n"
            << "  search <query> [--limit N]         Search documentation and SDK headers\n"
            << "  symbol <module> <symbol>           Show a symbol's declaration and docs\n"
            << "  frameworks [--filter F]            List SDK frameworks\n"
            << "  symbols <module> [--kind K]        List a module's public symbols\n"
            << "Shared options: --sdk <path> --developer-dir <path> --target <triple>\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "search") {
    return cmd_search(argc, argv);
  }
  if (subcommand == "symbol") {
    return cmd_symbol(argc, argv);
  }
  if (subcommand == "frameworks") {
    return cmd_frameworks(argc, argv);
  }
  if (subcommand == "symbols") {
    return cmd_symbols(argc, argv);
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
