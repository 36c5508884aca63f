#pragma once

#include "linkchat/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>

namespace linkchat::network {

struct InboundFrame {
    MacAddress source{};
    ByteBuffer payload;
};

// Unordered, unreliable, MTU-bounded delivery of opaque payloads between link-layer peers.
class FrameTransport {
public:
    using FrameHandler = std::function<void(const InboundFrame&)>;

    virtual ~FrameTransport() = default;

    virtual void start() = 0;
    virtual void stop() = 0;

    // False means the channel itself is unusable; callers must not retry.
    virtual bool send(const MacAddress& peer, std::span<const std::uint8_t> payload) = 0;

    virtual void set_frame_handler(FrameHandler handler) = 0;

    virtual MacAddress local_address() const = 0;
    virtual std::size_t max_frame_payload() const noexcept = 0;
};

}  // namespace linkchat::network
