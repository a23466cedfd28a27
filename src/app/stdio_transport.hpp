#pragma once

#include <cstddef>
#include <istream>
#include <ostream>
#include "server/agent_service.hpp"

namespace a2a::app {

// Newline-delimited JSON-RPC: one request per input line, one response per
// output line. tasks/sendSubscribe writes one line per event.
// Returns the number of requests served.
std::size_t serve_stdio(server::AgentService& service, std::istream& in, std::ostream& out);

}  // namespace a2a::app
