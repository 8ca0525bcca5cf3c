#pragma once
// Pump: the single consumer thread between the inbound stream and the
// message processor
//
// Reads one message at a time, calls the processor, and routes each reply
// back through the session. It also keeps the pairing aligned when the
// processor breaks its contract: a reply for a notification is dropped, a
// missing reply for a request is replaced by an internal error, and an
// exception becomes an internal error for id-bearing messages.

#include <almanac/transport/processor.hpp>
#include <almanac/transport/session.hpp>
#include <atomic>
#include <cstddef>
#include <thread>

namespace almanac::transport {

class Pump {
public:
    Pump(Session& session, MessageProcessor& processor)
        : session_(session), processor_(processor) {}

    // Joins the consumer thread; the session must have been closed first
    ~Pump() { join(); }

    Pump(const Pump&) = delete;
    Pump& operator=(const Pump&) = delete;

    void start();
    void join();

    bool running() const { return running_; }
    size_t processed() const { return processed_; }

private:
    void run_loop();
    void handle(const InboundMessage& message);

    Session& session_;
    MessageProcessor& processor_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> processed_{0};
};

} // namespace almanac::transport
