#include "server_loop.h"

#include "xdmcp/core/normalization.h"

#include "mcp_protocol.h"
#include <iostream>
#include <string>

namespace xdmcp::mcp {

void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out) {
  // Main loop: read JSON-RPC messages from in, write responses to out
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (core::trim(line).empty()) {
      continue;
    }

    const auto outcome = process_line(line, ctx);
    if (auto rendered = render_outcome(outcome)) {
      out << *rendered << "\n" << std::flush;
    }
  }

  std::cerr << "MCP Server shutting down\n";
}

}  // namespace xdmcp::mcp
