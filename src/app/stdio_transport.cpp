#include "app/stdio_transport.hpp"

#include <string>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "protocol/rpc_contract.hpp"
#include "server/event_sink.hpp"

namespace a2a::app {

using nlohmann::json;

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

}  // namespace

std::size_t serve_stdio(server::AgentService& service, std::istream& in, std::ostream& out) {
    std::size_t served = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (is_blank(line)) {
            continue;
        }
        ++served;

        const json request = json::parse(line, nullptr, false);
        if (request.is_discarded()) {
            A2A_LOG_WARN("stdio: rejecting unparsable request line");
            out << server::AgentService::parse_error_response().dump() << "\n";
            out.flush();
            continue;
        }

        if (server::AgentService::is_streaming_request(request)) {
            server::JsonLinesEventSink sink(out, protocol::request_id_of(request));
            service.handle_streaming(request, sink);
            continue;
        }

        out << service.handle(request).dump() << "\n";
        out.flush();
        if (!out.good()) {
            A2A_LOG_ERROR("stdio: output stream closed");
            break;
        }
    }
    return served;
}

}  // namespace a2a::app
