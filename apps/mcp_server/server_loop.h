#pragma once

#include "server_context.h"

#include <istream>
#include <ostream>

namespace lancet::mcp {

// run_server_loop reads one JSON-RPC request per line from in and writes one response per line
// to out until in reaches end of file. Notifications get no response.
void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out);

}  // namespace lancet::mcp
