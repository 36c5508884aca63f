#include "linkchat/transfer/AckChannel.hpp"

namespace linkchat::transfer {

bool AckChannel::post(AckEvent event) {
    {
        std::scoped_lock lock(mutex_);
        if (closed_) {
            return false;
        }
        events_.push_back(event);
    }
    cv_.notify_one();
    return true;
}

std::optional<AckEvent> AckChannel::wait_until(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock lock(mutex_);
    cv_.wait_until(lock, deadline, [this] { return closed_ || !events_.empty(); });
    if (closed_ || events_.empty()) {
        return std::nullopt;
    }
    const auto event = events_.front();
    events_.pop_front();
    return event;
}

void AckChannel::close() {
    {
        std::scoped_lock lock(mutex_);
        closed_ = true;
        events_.clear();
    }
    cv_.notify_all();
}

bool AckChannel::closed() const {
    std::scoped_lock lock(mutex_);
    return closed_;
}

std::size_t AckChannel::pending() const {
    std::scoped_lock lock(mutex_);
    return events_.size();
}

}  // namespace linkchat::transfer
