#pragma once
// Stdio Server: newline-delimited JSON-RPC over a pair of streams
//
// One caller, one message at a time, so no correlation is needed: each line
// goes straight to the processor and any reply is written back immediately.

#include <almanac/transport/processor.hpp>
#include <atomic>
#include <cstddef>
#include <iostream>

namespace almanac::transport {

class StdioServer {
public:
    explicit StdioServer(MessageProcessor& processor,
                         std::istream& in = std::cin,
                         std::ostream& out = std::cout)
        : processor_(processor), in_(in), out_(out) {}

    // Serve until EOF or stop(). Returns the number of lines processed.
    size_t run();

    void stop() { running_ = false; }

private:
    MessageProcessor& processor_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> running_{false};
};

} // namespace almanac::transport
