#pragma once

#include "linkchat/Config.hpp"
#include "linkchat/Types.hpp"
#include "linkchat/network/FrameTransport.hpp"
#include "linkchat/transfer/AckChannel.hpp"
#include "linkchat/transfer/Transfer.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace linkchat::transfer {

// Stop-and-wait delivery of one file per peer at a time. send_file blocks the calling
// thread; ACK/NACK frames arrive on the listener thread through resolve().
class FragmentSender {
public:
    using ProgressHandler = std::function<void(const TransferProgress&)>;

    explicit FragmentSender(network::FrameTransport& transport, Config config = {});

    FragmentSender(const FragmentSender&) = delete;
    FragmentSender& operator=(const FragmentSender&) = delete;

    TransferResult send_file(const MacAddress& peer, const std::string& name, std::span<const std::uint8_t> bytes);

    // Returns false when no transfer to the peer is in flight.
    bool resolve(const MacAddress& peer, AckEvent event);
    bool cancel(const MacAddress& peer);

    void set_progress_handler(ProgressHandler handler);

    [[nodiscard]] std::size_t active_transfers() const;
    [[nodiscard]] std::size_t max_fragment_size() const noexcept;
    const Config& config() const noexcept { return config_; }

private:
    enum class AckStatus {
        Waiting,
        Acked,
        Nacked,
    };

    struct PendingAck {
        std::uint32_t sequence{0};
        std::uint32_t attempt_count{0};
        AckStatus status{AckStatus::Waiting};
    };

    struct OutboundTransfer {
        MacAddress peer{};
        std::string name;
        std::uint64_t total_size{0};
        std::vector<std::span<const std::uint8_t>> fragments;
        std::size_t current_index{0};
        bool aborted{false};
        TransferReport report{};
    };

    class ChannelRegistration;

    std::shared_ptr<AckChannel> register_channel(const MacAddress& peer);
    void unregister_channel(const MacAddress& peer, const std::shared_ptr<AckChannel>& channel);

    std::optional<TransferFailure> deliver_fragment(OutboundTransfer& transfer, AckChannel& channel);
    TransferFailure make_failure(const OutboundTransfer& transfer, TransferError error) const;
    void report_progress(const OutboundTransfer& transfer, std::uint64_t bytes_acked) const;

    network::FrameTransport& transport_;
    Config config_{};

    mutable std::mutex channels_mutex_;
    std::unordered_map<std::string, std::shared_ptr<AckChannel>> channels_;

    mutable std::mutex progress_mutex_;
    ProgressHandler progress_handler_{};
};

}  // namespace linkchat::transfer
