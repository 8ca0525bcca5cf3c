#include <almanac/transport/session.hpp>
#include <almanac/log.hpp>
#include <cstdio>
#include <random>
#include <stdexcept>

namespace almanac::transport {

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Open: return "open";
        case SessionState::Closing: return "closing";
        case SessionState::Closed: return "closed";
    }
    return "unknown";
}

std::string generate_session_id() {
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    static std::uniform_int_distribution<uint64_t> dis;
    static std::mutex gen_mutex;

    uint64_t high = 0;
    uint64_t low = 0;
    {
        std::lock_guard<std::mutex> lock(gen_mutex);
        high = dis(gen);
        low = dis(gen);
    }

    // Version 4, variant 10xx
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<uint32_t>(high >> 32),
                  static_cast<uint16_t>(high >> 16),
                  static_cast<uint16_t>(high),
                  static_cast<uint16_t>(low >> 48),
                  static_cast<unsigned long long>(low & 0xFFFFFFFFFFFFULL));
    return buf;
}

std::unique_ptr<Session> Session::open(SessionOptions options) {
    auto session = std::make_unique<Session>(Key{}, generate_session_id(), options);
    log_info("session", "opened %s", session->id().c_str());
    return session;
}

Session::Session(Key, std::string id, SessionOptions options)
    : id_(std::move(id)), registry_(options.max_pending) {}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

Session::Submission Session::submit(std::string body, bool expects_reply) {
    std::lock_guard<std::mutex> lock(mutex_);
    Submission submission;

    if (state_ != SessionState::Open) {
        submission.admission = Admission::SessionClosed;
        return submission;
    }

    if (expects_reply) {
        submission.waiter = registry_.register_waiter(submission.admission);
        if (!submission.waiter) return submission;
    }

    if (!inbound_.publish({std::move(body), expects_reply})) {
        // Unreachable while Open: the stream is only finished during close()
        throw std::logic_error("inbound stream finished while session " + id_ + " is open");
    }

    submission.admission = Admission::Accepted;
    return submission;
}

bool Session::deliver(std::string reply) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Open) {
        log_debug("session", "dropping reply produced after close (%zu bytes)", reply.size());
        return false;
    }
    return registry_.deliver(std::move(reply));
}

bool Session::begin_close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Open) return false;

    state_ = SessionState::Closing;
    registry_.reject_new();
    log_info("session", "%s closing", id_.c_str());
    return true;
}

bool Session::finalize() {
    std::lock_guard<std::mutex> lock(mutex_);
    return finalize_locked();
}

bool Session::finalize_locked() {
    if (state_ == SessionState::Open) {
        throw std::logic_error("finalize called on open session " + id_);
    }
    if (state_ == SessionState::Closed) return false;
    if (registry_.pending() != 0 || !inbound_.finished()) return false;

    state_ = SessionState::Closed;
    log_info("session", "%s closed", id_.c_str());
    return true;
}

bool Session::close(const std::string& reason) {
    if (!begin_close()) {
        log_debug("session", "%s already %s, close ignored", id_.c_str(),
                  session_state_name(state()));
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    inbound_.finish();
    registry_.cancel_all(reason);
    if (!finalize_locked()) {
        throw std::logic_error("session " + id_ + " could not finalize after cancelling waiters");
    }
    return true;
}

} // namespace almanac::transport
