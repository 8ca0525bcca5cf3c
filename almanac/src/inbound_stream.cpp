#include <almanac/transport/inbound_stream.hpp>
#include <almanac/log.hpp>

namespace almanac::transport {

bool InboundStream::publish(InboundMessage message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_) return false;
        queue_.push_back(std::move(message));
    }
    ready_.notify_one();
    return true;
}

size_t InboundStream::finish() {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_) return 0;
        finished_ = true;
        dropped = queue_.size();
        queue_.clear();
    }
    ready_.notify_all();

    if (dropped > 0) {
        log_info("inbound", "stream finished, %zu unprocessed message(s) dropped", dropped);
    }
    return dropped;
}

std::optional<InboundMessage> InboundStream::next() {
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait(lock, [this] { return finished_ || !queue_.empty(); });

    if (finished_) return std::nullopt;

    InboundMessage message = std::move(queue_.front());
    queue_.pop_front();
    return message;
}

bool InboundStream::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

size_t InboundStream::backlog() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace almanac::transport
