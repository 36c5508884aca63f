#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace linkchat::transfer {

enum class AckOutcome {
    Ack,
    Nack,
};

struct AckEvent {
    std::uint32_t sequence{0};
    AckOutcome outcome{AckOutcome::Ack};
};

// Single-consumer mailbox between the frame listener and one sending transfer.
// The listener only posts; the owning transfer alone decides what an event means.
class AckChannel {
public:
    AckChannel() = default;

    AckChannel(const AckChannel&) = delete;
    AckChannel& operator=(const AckChannel&) = delete;

    // Returns false once the channel is closed.
    bool post(AckEvent event);

    // Empty result means the deadline passed or the channel was closed.
    std::optional<AckEvent> wait_until(std::chrono::steady_clock::time_point deadline);

    void close();
    [[nodiscard]] bool closed() const;
    [[nodiscard]] std::size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<AckEvent> events_;
    bool closed_{false};
};

}  // namespace linkchat::transfer
