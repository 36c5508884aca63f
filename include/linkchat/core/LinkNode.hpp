#pragma once

#include "linkchat/Config.hpp"
#include "linkchat/Types.hpp"
#include "linkchat/network/FrameTransport.hpp"
#include "linkchat/protocol/Packet.hpp"
#include "linkchat/storage/ReceiveDirectory.hpp"
#include "linkchat/transfer/FragmentReceiver.hpp"
#include "linkchat/transfer/FragmentSender.hpp"
#include "linkchat/transfer/Transfer.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace linkchat::core {

struct PeerInfo {
    MacAddress address{};
    std::string username;
    std::chrono::steady_clock::time_point last_seen{};
};

struct FolderReport {
    MacAddress peer{};
    std::string root;
    std::uint32_t folders{0};
    std::vector<transfer::TransferReport> files;
    std::uint64_t byte_count{0};
};

using FolderResult = std::variant<FolderReport, transfer::TransferFailure>;

// Chat, discovery and reliable file/folder exchange over one frame transport.
class LinkNode {
public:
    using TextHandler = std::function<void(const MacAddress& peer, const std::string& text)>;
    using TransferCompleteHandler =
        std::function<void(const std::string& name, std::uint64_t byte_count, const MacAddress& peer)>;

    LinkNode(network::FrameTransport& transport, Config config = {});
    // Received files go to the sink factory instead of config.receive_directory; folder
    // markers are then only logged.
    LinkNode(network::FrameTransport& transport, Config config, transfer::SinkFactory sink_factory);
    ~LinkNode();

    LinkNode(const LinkNode&) = delete;
    LinkNode& operator=(const LinkNode&) = delete;

    void start();
    void stop();
    bool running() const noexcept { return running_.load(); }

    bool send_text(const MacAddress& peer, const std::string& text);
    bool discover();
    std::vector<PeerInfo> known_peers() const;
    std::optional<PeerInfo> find_peer(const std::string& username) const;

    transfer::TransferResult send_file_bytes(const MacAddress& peer,
                                             const std::string& name,
                                             std::span<const std::uint8_t> bytes);
    transfer::TransferResult send_file(const MacAddress& peer, const std::filesystem::path& path);
    FolderResult send_folder(const MacAddress& peer, const std::filesystem::path& path);
    bool cancel_transfer(const MacAddress& peer);

    void on_transfer_complete(TransferCompleteHandler handler);
    void set_text_handler(TextHandler handler);
    void set_progress_handler(transfer::FragmentSender::ProgressHandler handler);

    MacAddress address() const { return transport_.local_address(); }
    const Config& config() const noexcept { return config_; }

private:
    void handle_frame(const network::InboundFrame& frame);
    void handle_text(const MacAddress& peer, const protocol::TextPayload& payload);
    void handle_discovery_request(const MacAddress& peer, const protocol::DiscoveryRequestPayload& payload);
    void handle_folder_start(const MacAddress& peer, const protocol::FolderStartPayload& payload);
    void handle_received(const transfer::ReceiveReport& report);
    void remember_peer(const MacAddress& peer, const std::string& username);
    bool send_packet(const MacAddress& peer, const protocol::Packet& packet);
    transfer::TransferFailure local_failure(const MacAddress& peer,
                                            const std::string& name,
                                            transfer::TransferError error,
                                            std::string detail) const;

    network::FrameTransport& transport_;
    Config config_{};
    std::optional<storage::ReceiveDirectory> directory_;
    transfer::FragmentSender sender_;
    transfer::FragmentReceiver receiver_;
    std::atomic<bool> running_{false};

    mutable std::mutex peers_mutex_;
    std::unordered_map<std::string, PeerInfo> peers_;

    std::mutex handlers_mutex_;
    TextHandler text_handler_{};
    TransferCompleteHandler complete_handler_{};
};

}  // namespace linkchat::core
