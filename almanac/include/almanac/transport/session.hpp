#pragma once
// Session: one logical duplex conversation
//
// Owns the session identifier, the Open -> Closing -> Closed state machine,
// the pending registry and the inbound stream. Admission (register a waiter,
// then publish) happens under the session lock so two id-bearing messages
// can never be registered in one order and published in the other.
//
// Lock order is always session -> registry -> stream.

#include <almanac/transport/inbound_stream.hpp>
#include <almanac/transport/pending_registry.hpp>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace almanac::transport {

enum class SessionState {
    Open,
    Closing,
    Closed,
};

const char* session_state_name(SessionState state);

// Random RFC 4122 version-4 style identifier
std::string generate_session_id();

struct SessionOptions {
    size_t max_pending = 0;  // 0 = unbounded
};

class Session {
    // Passkey: sessions come only from open()
    class Key {
        friend class Session;
        Key() = default;
    };

public:
    // Create a session in the Open state with a fresh identifier
    static std::unique_ptr<Session> open(SessionOptions options = {});

    Session(Key, std::string id, SessionOptions options);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& id() const { return id_; }
    SessionState state() const;

    struct Submission {
        Admission admission = Admission::SessionClosed;
        WaiterHandle waiter;  // set only for accepted messages expecting a reply
    };

    // Atomically register (when a reply is expected) and publish one message.
    // Nothing is published unless admission is Accepted.
    Submission submit(std::string body, bool expects_reply);

    // Route one processor reply to the oldest waiter. Replies arriving after
    // the session began closing are dropped quietly.
    bool deliver(std::string reply);

    // Open -> Closing: stop admitting. Returns false if not Open.
    bool begin_close();

    // Closing -> Closed once no waiter is queued and the stream is finished.
    // Returns false when those conditions do not hold yet or the session is
    // already Closed. Throws std::logic_error when called on an Open session.
    bool finalize();

    // Full termination: begin_close, finish the stream, cancel every waiter,
    // finalize. Returns false (and does nothing) if already closing or closed.
    bool close(const std::string& reason);

    PendingRegistry& registry() { return registry_; }
    InboundStream& inbound() { return inbound_; }

private:
    // Caller holds mutex_
    bool finalize_locked();

    const std::string id_;
    mutable std::mutex mutex_;
    SessionState state_ = SessionState::Open;
    PendingRegistry registry_;
    InboundStream inbound_;
};

} // namespace almanac::transport
