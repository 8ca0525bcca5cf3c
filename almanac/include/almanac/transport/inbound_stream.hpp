#pragma once
// Inbound Stream: many independently arriving HTTP bodies as one ordered
// stream for the single message-processor thread.
//
// Order is the order in which publish() calls complete. finish() ends the
// stream: later publishes are refused and anything not yet consumed is
// dropped, since its callers are being cancelled anyway.

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace almanac::transport {

struct InboundMessage {
    std::string body;
    bool expects_reply = false;
};

class InboundStream {
public:
    InboundStream() = default;

    InboundStream(const InboundStream&) = delete;
    InboundStream& operator=(const InboundStream&) = delete;

    // Returns false once the stream has been finished
    bool publish(InboundMessage message);

    // Mark the stream exhausted and wake the consumer.
    // Returns the number of unconsumed messages dropped.
    size_t finish();

    // Block until a message is available. Returns nullopt once finished.
    std::optional<InboundMessage> next();

    bool finished() const;
    size_t backlog() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<InboundMessage> queue_;
    bool finished_ = false;
};

} // namespace almanac::transport
