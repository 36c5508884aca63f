#include "linkchat/transfer/FragmentSender.hpp"

#include "linkchat/protocol/Packet.hpp"
#include "linkchat/util/StructuredLogger.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <utility>

namespace linkchat::transfer {

namespace {

using util::StructuredLogger;

// FILE_START carries a u16 name length and a u64 size next to the name.
constexpr std::size_t kFileStartOverhead = 2 + 8;

}  // namespace

class FragmentSender::ChannelRegistration {
public:
    ChannelRegistration(FragmentSender& owner, const MacAddress& peer)
        : owner_(owner), peer_(peer), channel_(owner.register_channel(peer)) {}

    ~ChannelRegistration() {
        if (channel_) {
            channel_->close();
            owner_.unregister_channel(peer_, channel_);
        }
    }

    ChannelRegistration(const ChannelRegistration&) = delete;
    ChannelRegistration& operator=(const ChannelRegistration&) = delete;

    AckChannel* get() const noexcept { return channel_.get(); }

private:
    FragmentSender& owner_;
    MacAddress peer_{};
    std::shared_ptr<AckChannel> channel_;
};

FragmentSender::FragmentSender(network::FrameTransport& transport, Config config)
    : transport_(transport), config_(std::move(config)) {}

std::size_t FragmentSender::max_fragment_size() const noexcept {
    const auto frame_capacity = std::min(transport_.max_frame_payload(), protocol::kHeaderSize + protocol::kMaxPayloadSize);
    const auto overhead = protocol::kHeaderSize + protocol::kFileDataOverhead;
    return frame_capacity > overhead ? frame_capacity - overhead : 0;
}

void FragmentSender::set_progress_handler(ProgressHandler handler) {
    std::scoped_lock lock(progress_mutex_);
    progress_handler_ = std::move(handler);
}

std::size_t FragmentSender::active_transfers() const {
    std::scoped_lock lock(channels_mutex_);
    return channels_.size();
}

std::shared_ptr<AckChannel> FragmentSender::register_channel(const MacAddress& peer) {
    std::scoped_lock lock(channels_mutex_);
    const auto key = mac_to_string(peer);
    if (channels_.find(key) != channels_.end()) {
        return nullptr;
    }
    auto channel = std::make_shared<AckChannel>();
    channels_.emplace(key, channel);
    return channel;
}

void FragmentSender::unregister_channel(const MacAddress& peer, const std::shared_ptr<AckChannel>& channel) {
    std::scoped_lock lock(channels_mutex_);
    const auto it = channels_.find(mac_to_string(peer));
    if (it != channels_.end() && it->second == channel) {
        channels_.erase(it);
    }
}

bool FragmentSender::resolve(const MacAddress& peer, AckEvent event) {
    std::shared_ptr<AckChannel> channel;
    {
        std::scoped_lock lock(channels_mutex_);
        const auto it = channels_.find(mac_to_string(peer));
        if (it == channels_.end()) {
            return false;
        }
        channel = it->second;
    }
    return channel->post(event);
}

bool FragmentSender::cancel(const MacAddress& peer) {
    std::shared_ptr<AckChannel> channel;
    {
        std::scoped_lock lock(channels_mutex_);
        const auto it = channels_.find(mac_to_string(peer));
        if (it == channels_.end()) {
            return false;
        }
        channel = it->second;
    }
    channel->close();
    return true;
}

TransferFailure FragmentSender::make_failure(const OutboundTransfer& transfer, TransferError error) const {
    TransferFailure failure{};
    failure.peer = transfer.peer;
    failure.name = transfer.name;
    failure.error = error;
    if (transfer.current_index > 0) {
        failure.last_acked_sequence = static_cast<std::uint32_t>(transfer.current_index - 1);
    }
    return failure;
}

void FragmentSender::report_progress(const OutboundTransfer& transfer, std::uint64_t bytes_acked) const {
    ProgressHandler handler;
    {
        std::scoped_lock lock(progress_mutex_);
        handler = progress_handler_;
    }
    if (!handler) {
        return;
    }
    TransferProgress progress{};
    progress.peer = transfer.peer;
    progress.name = transfer.name;
    progress.bytes_acked = bytes_acked;
    progress.total_bytes = transfer.total_size;
    progress.fragments_acked = static_cast<std::uint32_t>(transfer.current_index);
    progress.fragment_count = static_cast<std::uint32_t>(transfer.fragments.size());
    handler(progress);
}

TransferResult FragmentSender::send_file(const MacAddress& peer,
                                         const std::string& name,
                                         std::span<const std::uint8_t> bytes) {
    const auto started = std::chrono::steady_clock::now();

    OutboundTransfer transfer{};
    transfer.peer = peer;
    transfer.name = name;
    transfer.total_size = bytes.size();
    transfer.report.peer = peer;
    transfer.report.name = name;

    const auto fragment_size = config_.fragment_size;
    if (name.empty() || name.size() > protocol::kMaxPayloadSize - kFileStartOverhead) {
        auto failure = make_failure(transfer, TransferError::InvalidArgument);
        failure.detail = "file name must be between 1 and 65525 bytes";
        return failure;
    }
    if (fragment_size == 0 || fragment_size > max_fragment_size()) {
        auto failure = make_failure(transfer, TransferError::InvalidArgument);
        failure.detail = "fragment size " + std::to_string(fragment_size) + " exceeds transport capacity of " +
                         std::to_string(max_fragment_size()) + " bytes";
        return failure;
    }
    const auto fragment_count = (bytes.size() + fragment_size - 1) / fragment_size;
    if (fragment_count > static_cast<std::size_t>(std::numeric_limits<std::uint32_t>::max())) {
        auto failure = make_failure(transfer, TransferError::InvalidArgument);
        failure.detail = "file needs more fragments than a 32-bit sequence can number";
        return failure;
    }

    ChannelRegistration registration(*this, peer);
    if (registration.get() == nullptr) {
        auto failure = make_failure(transfer, TransferError::PeerBusy);
        failure.detail = "another transfer to this peer is in flight";
        return failure;
    }

    transfer.fragments.reserve(fragment_count);
    for (std::size_t offset = 0; offset < bytes.size(); offset += fragment_size) {
        transfer.fragments.push_back(bytes.subspan(offset, std::min(fragment_size, bytes.size() - offset)));
    }

    util::log_event(StructuredLogger::Level::Info,
                    "transfer.send.start",
                    {{"peer", mac_to_string(peer)},
                     {"file", name},
                     {"bytes", std::to_string(bytes.size())},
                     {"fragments", std::to_string(transfer.fragments.size())}});

    protocol::FileStartPayload start{};
    start.name = name;
    start.total_size = bytes.size();
    if (!transport_.send(peer, protocol::encode(protocol::Packet{start}))) {
        auto failure = make_failure(transfer, TransferError::TransportUnavailable);
        failure.detail = "FILE_START could not be sent";
        util::log_event(StructuredLogger::Level::Error, "transfer.send.failed", {{"reason", failure.describe()}});
        return failure;
    }

    std::uint64_t bytes_acked = 0;
    while (transfer.current_index < transfer.fragments.size()) {
        if (auto failure = deliver_fragment(transfer, *registration.get())) {
            transfer.aborted = true;
            util::log_event(StructuredLogger::Level::Error,
                            "transfer.send.failed",
                            {{"peer", mac_to_string(peer)},
                             {"file", name},
                             {"error", std::string(to_string(failure->error))},
                             {"reason", failure->describe()}});
            return std::move(*failure);
        }
        bytes_acked += transfer.fragments[transfer.current_index].size();
        ++transfer.current_index;
        report_progress(transfer, bytes_acked);
    }

    if (!transport_.send(peer, protocol::encode(protocol::Packet{protocol::FileEndPayload{}}))) {
        auto failure = make_failure(transfer, TransferError::TransportUnavailable);
        failure.detail = "FILE_END could not be sent";
        util::log_event(StructuredLogger::Level::Error, "transfer.send.failed", {{"reason", failure.describe()}});
        return failure;
    }

    auto report = transfer.report;
    report.byte_count = bytes.size();
    report.fragment_count = static_cast<std::uint32_t>(transfer.fragments.size());
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    util::log_event(StructuredLogger::Level::Info,
                    "transfer.send.complete",
                    {{"peer", mac_to_string(peer)},
                     {"file", name},
                     {"bytes", std::to_string(report.byte_count)},
                     {"fragments", std::to_string(report.fragment_count)},
                     {"retransmissions", std::to_string(report.retransmissions)},
                     {"elapsed_ms", std::to_string(report.elapsed.count())}});
    return report;
}

std::optional<TransferFailure> FragmentSender::deliver_fragment(OutboundTransfer& transfer, AckChannel& channel) {
    const auto sequence = static_cast<std::uint32_t>(transfer.current_index);
    const auto frame = protocol::encode(protocol::Packet{protocol::make_file_data(sequence, transfer.fragments[transfer.current_index])});

    PendingAck pending{};
    pending.sequence = sequence;
    std::optional<TransferError> last_cause;

    while (true) {
        if (pending.attempt_count >= config_.max_retries) {
            auto failure = make_failure(transfer, TransferError::RetryCeilingExceeded);
            failure.failed_sequence = sequence;
            failure.attempts = pending.attempt_count;
            failure.last_cause = last_cause;
            return failure;
        }

        ++pending.attempt_count;
        pending.status = AckStatus::Waiting;
        if (pending.attempt_count > 1) {
            ++transfer.report.retransmissions;
            util::log_event(StructuredLogger::Level::Info,
                            "transfer.fragment.retry",
                            {{"peer", mac_to_string(transfer.peer)},
                             {"sequence", std::to_string(sequence)},
                             {"attempt", std::to_string(pending.attempt_count)},
                             {"cause", std::string(to_string(*last_cause))}});
        }

        if (!transport_.send(transfer.peer, frame)) {
            auto failure = make_failure(transfer, TransferError::TransportUnavailable);
            failure.failed_sequence = sequence;
            failure.attempts = pending.attempt_count;
            return failure;
        }
        ++transfer.report.transmissions;

        const auto deadline = std::chrono::steady_clock::now() + config_.ack_timeout;
        while (pending.status == AckStatus::Waiting) {
            const auto event = channel.wait_until(deadline);
            if (!event.has_value()) {
                if (channel.closed()) {
                    auto failure = make_failure(transfer, TransferError::Cancelled);
                    failure.failed_sequence = sequence;
                    failure.attempts = pending.attempt_count;
                    return failure;
                }
                break;
            }
            if (event->sequence != sequence) {
                // Late answer to a fragment that was already resolved.
                util::log_event(StructuredLogger::Level::Debug,
                                "transfer.fragment.stale_ack",
                                {{"peer", mac_to_string(transfer.peer)},
                                 {"expected", std::to_string(sequence)},
                                 {"received", std::to_string(event->sequence)}});
                continue;
            }
            pending.status = event->outcome == AckOutcome::Ack ? AckStatus::Acked : AckStatus::Nacked;
        }

        switch (pending.status) {
            case AckStatus::Acked:
                return std::nullopt;
            case AckStatus::Nacked:
                ++transfer.report.nacks;
                last_cause = TransferError::NegativeAcknowledged;
                break;
            case AckStatus::Waiting:
                ++transfer.report.timeouts;
                last_cause = TransferError::AckTimeout;
                break;
        }
    }
}

}  // namespace linkchat::transfer
