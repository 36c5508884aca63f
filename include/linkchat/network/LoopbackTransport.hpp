#pragma once

#include "linkchat/network/FrameTransport.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace linkchat::network {

class LoopbackTransport;

// In-process broadcast domain connecting LoopbackTransport endpoints by MAC address.
class LoopbackHub {
public:
    struct Hooks {
        // Return false to drop the frame; the frame may be mutated in place.
        std::function<bool(const MacAddress& from, const MacAddress& to, ByteBuffer& frame)> on_transmit;
    };

    LoopbackHub() = default;

    LoopbackHub(const LoopbackHub&) = delete;
    LoopbackHub& operator=(const LoopbackHub&) = delete;

    void set_hooks(Hooks hooks);
    void set_link_up(bool up);
    [[nodiscard]] bool link_up() const;

    std::size_t frames_transmitted() const noexcept;
    std::size_t frames_dropped() const noexcept;

private:
    friend class LoopbackTransport;

    void attach(LoopbackTransport* endpoint);
    void detach(LoopbackTransport* endpoint);
    bool transmit(const MacAddress& from, const MacAddress& to, std::span<const std::uint8_t> payload);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, LoopbackTransport*> endpoints_;
    Hooks hooks_{};
    bool link_up_{true};
    std::atomic<std::size_t> transmitted_{0};
    std::atomic<std::size_t> dropped_{0};
};

class LoopbackTransport final : public FrameTransport {
public:
    static constexpr std::size_t kDefaultMaxPayload = 1500;

    LoopbackTransport(LoopbackHub& hub, MacAddress address, std::size_t max_payload = kDefaultMaxPayload);
    ~LoopbackTransport() override;

    LoopbackTransport(const LoopbackTransport&) = delete;
    LoopbackTransport& operator=(const LoopbackTransport&) = delete;

    void start() override;
    void stop() override;

    bool send(const MacAddress& peer, std::span<const std::uint8_t> payload) override;
    void set_frame_handler(FrameHandler handler) override;

    MacAddress local_address() const override { return address_; }
    std::size_t max_frame_payload() const noexcept override { return max_payload_; }

private:
    friend class LoopbackHub;

    void enqueue(InboundFrame frame);
    void dispatch_loop();

    LoopbackHub& hub_;
    MacAddress address_{};
    std::size_t max_payload_{kDefaultMaxPayload};

    std::mutex handler_mutex_;
    FrameHandler handler_{};

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<InboundFrame> queue_;
    std::atomic<bool> running_{false};
    std::thread dispatcher_;
};

}  // namespace linkchat::network
