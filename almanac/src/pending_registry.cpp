#include <almanac/transport/pending_registry.hpp>
#include <almanac/log.hpp>
#include <memory>
#include <stdexcept>

namespace almanac::transport {

const char* outcome_kind_name(Outcome::Kind kind) {
    switch (kind) {
        case Outcome::Kind::Reply: return "reply";
        case Outcome::Kind::Cancelled: return "cancelled";
        case Outcome::Kind::TimedOut: return "timed_out";
    }
    return "unknown";
}

const char* admission_name(Admission admission) {
    switch (admission) {
        case Admission::Accepted: return "accepted";
        case Admission::SessionClosed: return "session_closed";
        case Admission::TooManyPending: return "too_many_pending";
    }
    return "unknown";
}

PendingRegistry::PendingRegistry(size_t max_pending)
    : max_pending_(max_pending) {}

WaiterHandle PendingRegistry::register_waiter(Admission& admission) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!accepting_) {
        admission = Admission::SessionClosed;
        return nullptr;
    }
    if (max_pending_ > 0 && queue_.size() >= max_pending_) {
        admission = Admission::TooManyPending;
        log_warning("registry", "rejecting registration: %zu waiters outstanding (cap %zu)",
                    queue_.size(), max_pending_);
        return nullptr;
    }

    auto waiter = std::make_shared<Waiter>(Waiter::Key{}, next_sequence_++);
    queue_.push_back(waiter);
    admission = Admission::Accepted;

    log_trace("registry", "registered waiter #%llu (pending=%zu)",
              static_cast<unsigned long long>(waiter->sequence()), queue_.size());
    return waiter;
}

Outcome PendingRegistry::await_resolution(const WaiterHandle& waiter,
                                          std::chrono::milliseconds timeout) {
    if (!waiter) {
        throw std::logic_error("await_resolution called without a waiter");
    }
    if (!waiter->future_.valid()) {
        throw std::logic_error("await_resolution called twice for waiter #" +
                               std::to_string(waiter->sequence()));
    }

    if (timeout.count() > 0 &&
        waiter->future_.wait_for(timeout) == std::future_status::timeout) {
        std::lock_guard<std::mutex> lock(mutex_);
        // The reply may have landed between wait_for() and taking the lock
        if (!waiter->resolved_) {
            waiter->abandoned_ = true;
            resolve(*waiter, Outcome::timed_out(
                "no reply within " + std::to_string(timeout.count()) + "ms"));
            log_notice("registry", "waiter #%llu timed out after %lldms",
                       static_cast<unsigned long long>(waiter->sequence()),
                       static_cast<long long>(timeout.count()));
        }
    }

    return waiter->future_.get();
}

bool PendingRegistry::deliver(std::string reply) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (queue_.empty()) {
        log_warning("registry", "reply with no waiter queued (%zu bytes dropped); "
                    "processor produced more replies than requests", reply.size());
        return false;
    }

    WaiterHandle head = std::move(queue_.front());
    queue_.pop_front();

    if (head->abandoned_) {
        log_debug("registry", "discarding late reply for timed-out waiter #%llu",
                  static_cast<unsigned long long>(head->sequence()));
        return true;
    }

    resolve(*head, Outcome::reply(std::move(reply)));
    log_trace("registry", "delivered reply to waiter #%llu (pending=%zu)",
              static_cast<unsigned long long>(head->sequence()), queue_.size());
    return true;
}

void PendingRegistry::reject_new() {
    std::lock_guard<std::mutex> lock(mutex_);
    accepting_ = false;
}

size_t PendingRegistry::cancel_all(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    accepting_ = false;

    size_t woken = 0;
    for (auto& waiter : queue_) {
        // Abandoned waiters already told their caller about the timeout
        if (!waiter->resolved_) {
            resolve(*waiter, Outcome::cancelled(reason));
            ++woken;
        }
    }
    queue_.clear();

    if (woken > 0) {
        log_info("registry", "cancelled %zu pending waiter(s): %s", woken, reason.c_str());
    }
    return woken;
}

size_t PendingRegistry::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool PendingRegistry::accepting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accepting_;
}

uint64_t PendingRegistry::registered_total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_sequence_ - 1;
}

void PendingRegistry::resolve(Waiter& waiter, Outcome outcome) {
    if (waiter.resolved_) {
        log_critical("registry", "waiter #%llu resolved twice",
                     static_cast<unsigned long long>(waiter.sequence()));
        throw std::logic_error("waiter #" + std::to_string(waiter.sequence()) +
                               " resolved twice");
    }
    waiter.resolved_ = true;
    waiter.promise_.set_value(std::move(outcome));
}

} // namespace almanac::transport
