#include "linkchat/network/LoopbackTransport.hpp"

#include <utility>

namespace linkchat::network {

void LoopbackHub::set_hooks(Hooks hooks) {
    std::scoped_lock lock(mutex_);
    hooks_ = std::move(hooks);
}

void LoopbackHub::set_link_up(bool up) {
    std::scoped_lock lock(mutex_);
    link_up_ = up;
}

bool LoopbackHub::link_up() const {
    std::scoped_lock lock(mutex_);
    return link_up_;
}

std::size_t LoopbackHub::frames_transmitted() const noexcept {
    return transmitted_.load(std::memory_order_relaxed);
}

std::size_t LoopbackHub::frames_dropped() const noexcept {
    return dropped_.load(std::memory_order_relaxed);
}

void LoopbackHub::attach(LoopbackTransport* endpoint) {
    std::scoped_lock lock(mutex_);
    endpoints_[mac_to_string(endpoint->local_address())] = endpoint;
}

void LoopbackHub::detach(LoopbackTransport* endpoint) {
    std::scoped_lock lock(mutex_);
    const auto it = endpoints_.find(mac_to_string(endpoint->local_address()));
    if (it != endpoints_.end() && it->second == endpoint) {
        endpoints_.erase(it);
    }
}

// Hooks run under the hub lock and must not call back into the hub.
bool LoopbackHub::transmit(const MacAddress& from, const MacAddress& to, std::span<const std::uint8_t> payload) {
    std::scoped_lock lock(mutex_);
    if (!link_up_) {
        return false;
    }

    std::vector<LoopbackTransport*> targets;
    if (to == kBroadcastMac) {
        for (const auto& [key, endpoint] : endpoints_) {
            if (endpoint->local_address() != from) {
                targets.push_back(endpoint);
            }
        }
    } else {
        const auto it = endpoints_.find(mac_to_string(to));
        if (it != endpoints_.end()) {
            targets.push_back(it->second);
        }
    }

    for (auto* target : targets) {
        InboundFrame frame{};
        frame.source = from;
        frame.payload.assign(payload.begin(), payload.end());
        transmitted_.fetch_add(1, std::memory_order_relaxed);
        if (hooks_.on_transmit && !hooks_.on_transmit(from, target->local_address(), frame.payload)) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            continue;
        }
        target->enqueue(std::move(frame));
    }
    return true;
}

LoopbackTransport::LoopbackTransport(LoopbackHub& hub, MacAddress address, std::size_t max_payload)
    : hub_(hub), address_(address), max_payload_(max_payload) {}

LoopbackTransport::~LoopbackTransport() {
    stop();
}

void LoopbackTransport::start() {
    if (running_.exchange(true)) {
        return;
    }
    dispatcher_ = std::thread(&LoopbackTransport::dispatch_loop, this);
    hub_.attach(this);
}

void LoopbackTransport::stop() {
    {
        // Flipped under the queue lock so the dispatcher cannot miss the wakeup.
        std::scoped_lock lock(queue_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    hub_.detach(this);
    queue_cv_.notify_all();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
    std::scoped_lock lock(queue_mutex_);
    queue_.clear();
}

bool LoopbackTransport::send(const MacAddress& peer, std::span<const std::uint8_t> payload) {
    if (!running_.load() || payload.size() > max_payload_) {
        return false;
    }
    return hub_.transmit(address_, peer, payload);
}

void LoopbackTransport::set_frame_handler(FrameHandler handler) {
    std::scoped_lock lock(handler_mutex_);
    handler_ = std::move(handler);
}

void LoopbackTransport::enqueue(InboundFrame frame) {
    {
        std::scoped_lock lock(queue_mutex_);
        queue_.push_back(std::move(frame));
    }
    queue_cv_.notify_one();
}

void LoopbackTransport::dispatch_loop() {
    while (true) {
        InboundFrame frame{};
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !queue_.empty() || !running_.load(); });
            if (!running_.load()) {
                return;
            }
            frame = std::move(queue_.front());
            queue_.pop_front();
        }

        FrameHandler handler;
        {
            std::scoped_lock lock(handler_mutex_);
            handler = handler_;
        }
        if (handler) {
            handler(frame);
        }
    }
}

}  // namespace linkchat::network
