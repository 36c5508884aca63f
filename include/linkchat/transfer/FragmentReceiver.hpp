#pragma once

#include "linkchat/Types.hpp"
#include "linkchat/network/FrameTransport.hpp"
#include "linkchat/protocol/Packet.hpp"
#include "linkchat/transfer/OutputSink.hpp"
#include "linkchat/transfer/Transfer.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

namespace linkchat::transfer {

enum class ReceiveDisposition {
    Ignored,
    Malformed,
    Opened,
    Accepted,
    Duplicate,
    Corrupt,
    OutOfOrder,
    Completed,
    Failed,
};

std::string_view to_string(ReceiveDisposition disposition) noexcept;

// Per-peer reassembly of inbound files: Idle -> Open (FILE_START) -> Closed (FILE_END).
class FragmentReceiver {
public:
    using CompletionHandler = std::function<void(const ReceiveReport&)>;

    FragmentReceiver(network::FrameTransport& transport, SinkFactory sink_factory);
    ~FragmentReceiver();

    FragmentReceiver(const FragmentReceiver&) = delete;
    FragmentReceiver& operator=(const FragmentReceiver&) = delete;

    ReceiveDisposition handle_inbound(const MacAddress& peer, std::span<const std::uint8_t> frame);
    ReceiveDisposition handle_packet(const MacAddress& peer, const protocol::Packet& packet);

    void set_completion_handler(CompletionHandler handler);

    bool abandon(const MacAddress& peer);
    [[nodiscard]] std::size_t open_transfers() const;
    std::optional<ReceiveReport> snapshot(const MacAddress& peer) const;

private:
    struct InboundTransfer {
        MacAddress peer{};
        std::string name;
        std::uint64_t expected_size{0};
        std::uint64_t bytes_written{0};
        std::uint32_t next_sequence{0};
        std::uint32_t duplicates{0};
        std::uint32_t corrupt{0};
        std::unique_ptr<OutputSink> sink;
        bool closed{false};
        std::chrono::steady_clock::time_point opened_at{};
    };

    ReceiveDisposition handle_file_start(const MacAddress& peer, const protocol::FileStartPayload& payload);
    ReceiveDisposition handle_file_data(const MacAddress& peer, const protocol::FileDataPayload& payload);
    ReceiveDisposition handle_file_end(const MacAddress& peer);

    static ReceiveReport make_report(const InboundTransfer& transfer);
    void respond(const MacAddress& peer, const protocol::Packet& packet);
    void notify_completion(const ReceiveReport& report);

    network::FrameTransport& transport_;
    SinkFactory sink_factory_;

    mutable std::mutex transfers_mutex_;
    std::unordered_map<std::string, InboundTransfer> transfers_;

    std::mutex handler_mutex_;
    CompletionHandler completion_handler_{};
};

}  // namespace linkchat::transfer
