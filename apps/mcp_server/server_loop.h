#pragma once

#include "server_context.h"
#include <istream>
#include <ostream>

namespace xdmcp::mcp {

// run_server_loop reads newline-delimited JSON-RPC messages from in until EOF and writes
// one line per response to out, flushing after each. Blank lines are skipped.
void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out);

}  // namespace xdmcp::mcp
