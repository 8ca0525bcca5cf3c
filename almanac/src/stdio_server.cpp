#include <almanac/transport/stdio_server.hpp>
#include <almanac/rpc/protocol.hpp>
#include <almanac/log.hpp>
#include <exception>
#include <string>

namespace almanac::transport {

size_t StdioServer::run() {
    running_ = true;
    size_t processed = 0;
    std::string line;

    log_info("stdio", "listening on stdin");

    while (running_ && std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        ++processed;
        try {
            auto reply = processor_.process(line);
            if (reply) {
                out_ << *reply << "\n";
                out_.flush();
            }
        } catch (const std::exception& e) {
            log_error("stdio", "processor threw: %s", e.what());
            std::string error_msg;
            auto envelope = rpc::decode_envelope(line, error_msg);
            if (envelope && envelope->has_correlation_id) {
                out_ << rpc::dump(rpc::make_error(envelope->id, rpc::error::INTERNAL_ERROR,
                                                  std::string("Internal error: ") + e.what()))
                     << "\n";
                out_.flush();
            }
        }
    }

    running_ = false;
    log_info("stdio", "input closed after %zu message(s)", processed);
    return processed;
}

} // namespace almanac::transport
