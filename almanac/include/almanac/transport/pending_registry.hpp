#pragma once
// Pending Registry: pairs each outbound reply with the caller waiting for it
//
// Callers register a waiter before their message is published and then block
// in await_resolution(). Replies are handed out strictly oldest-waiter-first,
// which is only sound because the message processor answers in arrival order.
// Nothing outside this class sees the queue, so the pairing strategy can be
// swapped (e.g. for an id-keyed map) without touching callers.
//
// Each waiter owns a one-shot promise. Resolution goes through resolve(),
// which refuses a second completion, so a waiter cannot be answered twice.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>

namespace almanac::transport {

// What a blocked caller wakes up with
struct Outcome {
    enum class Kind {
        Reply,      // payload holds the encoded reply
        Cancelled,  // session ended while waiting; reason says why
        TimedOut,   // this caller gave up; the session lives on
    };

    Kind kind = Kind::Reply;
    std::string payload;
    std::string reason;

    static Outcome reply(std::string payload) {
        return {Kind::Reply, std::move(payload), ""};
    }

    static Outcome cancelled(std::string reason) {
        return {Kind::Cancelled, "", std::move(reason)};
    }

    static Outcome timed_out(std::string reason) {
        return {Kind::TimedOut, "", std::move(reason)};
    }

    bool ok() const { return kind == Kind::Reply; }
};

const char* outcome_kind_name(Outcome::Kind kind);

// Result of asking for a waiter slot
enum class Admission {
    Accepted,
    SessionClosed,
    TooManyPending,
};

const char* admission_name(Admission admission);

class PendingRegistry;

// One blocked caller. Only the registry mutates it; the caller just waits.
class Waiter {
    // Passkey: only the registry creates waiters
    class Key {
        friend class PendingRegistry;
        Key() = default;
    };

public:
    Waiter(Key, uint64_t sequence)
        : sequence_(sequence), future_(promise_.get_future()) {}

    Waiter(const Waiter&) = delete;
    Waiter& operator=(const Waiter&) = delete;

    uint64_t sequence() const { return sequence_; }

private:
    friend class PendingRegistry;

    uint64_t sequence_;
    std::promise<Outcome> promise_;
    std::future<Outcome> future_;

    // Guarded by PendingRegistry::mutex_
    bool resolved_ = false;
    bool abandoned_ = false;  // timed out but still holds its queue position
};

using WaiterHandle = std::shared_ptr<Waiter>;

class PendingRegistry {
public:
    // max_pending = 0 leaves the queue unbounded
    explicit PendingRegistry(size_t max_pending = 0);

    PendingRegistry(const PendingRegistry&) = delete;
    PendingRegistry& operator=(const PendingRegistry&) = delete;

    // Append a waiter with the next arrival sequence number.
    // Returns nullptr and sets admission when the registry is closed or full.
    WaiterHandle register_waiter(Admission& admission);

    // Block until the waiter is resolved. A non-zero timeout abandons just this
    // waiter: it keeps its place so the reply later produced for it is
    // discarded rather than handed to the next caller. Must be called at most
    // once per waiter; never holds the registry lock while blocked.
    Outcome await_resolution(const WaiterHandle& waiter,
                             std::chrono::milliseconds timeout = std::chrono::milliseconds{0});

    // Resolve the oldest waiter with reply. Returns false (and logs) when no
    // waiter is queued, which means the processor produced an extra reply.
    bool deliver(std::string reply);

    // Stop accepting registrations; queued waiters are left untouched
    void reject_new();

    // Reject new registrations and resolve every queued waiter with a
    // cancellation carrying reason. Returns how many callers were woken.
    // A second call finds nothing queued and returns 0.
    size_t cancel_all(const std::string& reason);

    size_t pending() const;
    bool accepting() const;
    uint64_t registered_total() const;

private:
    // Caller holds mutex_
    void resolve(Waiter& waiter, Outcome outcome);

    mutable std::mutex mutex_;
    std::deque<WaiterHandle> queue_;
    uint64_t next_sequence_ = 1;
    size_t max_pending_;
    bool accepting_ = true;
};

} // namespace almanac::transport
