#pragma once
// Message processor contract consumed by the transport layer
//
// The transport hands over one decoded message at a time, strictly in
// arrival order, from a single thread. The processor must return exactly one
// encoded reply for every message carrying an "id" member, in that same
// order, and nothing for notifications. Reply pairing in PendingRegistry
// relies on this.

#include <optional>
#include <string>

namespace almanac::transport {

class MessageProcessor {
public:
    virtual ~MessageProcessor() = default;

    virtual std::optional<std::string> process(const std::string& message) = 0;
};

} // namespace almanac::transport
