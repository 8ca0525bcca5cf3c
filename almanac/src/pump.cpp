#include <almanac/transport/pump.hpp>
#include <almanac/rpc/protocol.hpp>
#include <almanac/log.hpp>
#include <exception>
#include <optional>
#include <string>

namespace almanac::transport {

namespace {

// Rebuild an error reply carrying the caller's id, so the waiter still
// receives something it can correlate
std::string internal_error_for(const std::string& body, const std::string& message) {
    std::string error_msg;
    auto envelope = rpc::decode_envelope(body, error_msg);
    rpc::json id = envelope ? envelope->id : rpc::json();
    return rpc::dump(rpc::make_error(id, rpc::error::INTERNAL_ERROR, message));
}

} // namespace

void Pump::start() {
    if (running_.exchange(true)) return;  // Already running

    thread_ = std::thread([this]() {
        run_loop();
    });
}

void Pump::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void Pump::run_loop() {
    log_debug("pump", "consumer started for session %s", session_.id().c_str());

    while (auto message = session_.inbound().next()) {
        handle(*message);
        ++processed_;
    }

    // A stream finished by close() leaves the session Closed already;
    // finalize only matters if the stream ended some other way
    if (session_.state() == SessionState::Closing) {
        session_.finalize();
    }

    running_ = false;
    log_debug("pump", "consumer stopped after %zu message(s)", processed_.load());
}

void Pump::handle(const InboundMessage& message) {
    std::optional<std::string> reply;
    try {
        reply = processor_.process(message.body);
    } catch (const std::exception& e) {
        log_error("pump", "processor threw: %s", e.what());
        if (message.expects_reply) {
            reply = internal_error_for(message.body, std::string("Internal error: ") + e.what());
        } else {
            reply.reset();
        }
    }

    if (!message.expects_reply) {
        if (reply) {
            log_warning("pump", "processor replied to a notification; reply dropped");
        }
        return;
    }

    if (!reply) {
        log_error("pump", "processor produced no reply for a request; answering with an error");
        reply = internal_error_for(message.body, "Internal error: no reply produced");
    }

    session_.deliver(std::move(*reply));
}

} // namespace almanac::transport
