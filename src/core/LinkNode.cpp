#include "linkchat/core/LinkNode.hpp"

#include "linkchat/util/StructuredLogger.hpp"

#include <stdexcept>
#include <utility>

namespace linkchat::core {

namespace {

using util::StructuredLogger;

}  // namespace

LinkNode::LinkNode(network::FrameTransport& transport, Config config)
    : transport_(transport),
      config_(std::move(config)),
      directory_(std::in_place, config_.receive_directory),
      sender_(transport_, config_),
      receiver_(transport_, directory_->sink_factory()) {
    receiver_.set_completion_handler([this](const transfer::ReceiveReport& report) { handle_received(report); });
}

LinkNode::LinkNode(network::FrameTransport& transport, Config config, transfer::SinkFactory sink_factory)
    : transport_(transport),
      config_(std::move(config)),
      sender_(transport_, config_),
      receiver_(transport_, std::move(sink_factory)) {
    receiver_.set_completion_handler([this](const transfer::ReceiveReport& report) { handle_received(report); });
}

LinkNode::~LinkNode() {
    stop();
}

void LinkNode::start() {
    if (running_.load()) {
        return;
    }
    transport_.set_frame_handler([this](const network::InboundFrame& frame) { handle_frame(frame); });
    transport_.start();
    running_.store(true);
    util::log_event(StructuredLogger::Level::Info,
                    "node.started",
                    {{"address", mac_to_string(transport_.local_address())}, {"username", config_.username}});
}

void LinkNode::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    transport_.stop();
    transport_.set_frame_handler({});
    util::log_event(StructuredLogger::Level::Info, "node.stopped");
}

bool LinkNode::send_text(const MacAddress& peer, const std::string& text) {
    if (text.size() > transport_.max_frame_payload() - protocol::kHeaderSize) {
        util::log_event(StructuredLogger::Level::Warning,
                        "node.text.too_long",
                        {{"peer", mac_to_string(peer)}, {"bytes", std::to_string(text.size())}});
        return false;
    }
    return send_packet(peer, protocol::TextPayload{text});
}

bool LinkNode::discover() {
    return send_packet(kBroadcastMac, protocol::DiscoveryRequestPayload{config_.username});
}

std::vector<PeerInfo> LinkNode::known_peers() const {
    std::scoped_lock lock(peers_mutex_);
    std::vector<PeerInfo> peers;
    peers.reserve(peers_.size());
    for (const auto& [key, info] : peers_) {
        peers.push_back(info);
    }
    return peers;
}

std::optional<PeerInfo> LinkNode::find_peer(const std::string& username) const {
    std::scoped_lock lock(peers_mutex_);
    for (const auto& [key, info] : peers_) {
        if (info.username == username) {
            return info;
        }
    }
    return std::nullopt;
}

transfer::TransferResult LinkNode::send_file_bytes(const MacAddress& peer,
                                                   const std::string& name,
                                                   std::span<const std::uint8_t> bytes) {
    if (!running_.load()) {
        return local_failure(peer, name, transfer::TransferError::TransportUnavailable, "node is not running");
    }
    return sender_.send_file(peer, name, bytes);
}

transfer::TransferResult LinkNode::send_file(const MacAddress& peer, const std::filesystem::path& path) {
    const auto name = path.filename().string();
    const auto bytes = storage::read_file_bytes(path);
    if (!bytes.has_value()) {
        return local_failure(peer, name, transfer::TransferError::InvalidArgument, "cannot read " + path.string());
    }
    return send_file_bytes(peer, name, *bytes);
}

FolderResult LinkNode::send_folder(const MacAddress& peer, const std::filesystem::path& path) {
    std::vector<storage::FolderEntry> entries;
    try {
        entries = storage::walk_folder(path);
    } catch (const std::runtime_error& error) {
        return local_failure(peer, path.string(), transfer::TransferError::InvalidArgument, error.what());
    }
    if (!running_.load()) {
        return local_failure(peer, path.string(), transfer::TransferError::TransportUnavailable, "node is not running");
    }

    FolderReport report{};
    report.peer = peer;
    report.root = entries.front().relative_path;
    util::log_event(StructuredLogger::Level::Info,
                    "folder.send.start",
                    {{"peer", mac_to_string(peer)},
                     {"folder", report.root},
                     {"entries", std::to_string(entries.size())}});

    for (const auto& entry : entries) {
        switch (entry.kind) {
            case storage::FolderEntry::Kind::FolderStart:
                if (!send_packet(peer, protocol::FolderStartPayload{entry.relative_path})) {
                    return local_failure(peer,
                                         entry.relative_path,
                                         transfer::TransferError::TransportUnavailable,
                                         "FOLDER_START could not be sent");
                }
                ++report.folders;
                break;
            case storage::FolderEntry::Kind::File: {
                const auto bytes = storage::read_file_bytes(entry.source);
                if (!bytes.has_value()) {
                    return local_failure(peer,
                                         entry.relative_path,
                                         transfer::TransferError::InvalidArgument,
                                         "cannot read " + entry.source.string());
                }
                auto result = sender_.send_file(peer, entry.relative_path, *bytes);
                if (auto* failure = std::get_if<transfer::TransferFailure>(&result)) {
                    util::log_event(StructuredLogger::Level::Error,
                                    "folder.send.failed",
                                    {{"peer", mac_to_string(peer)},
                                     {"folder", report.root},
                                     {"file", entry.relative_path},
                                     {"reason", std::string(transfer::to_string(failure->error))}});
                    return std::move(*failure);
                }
                auto& sent = std::get<transfer::TransferReport>(result);
                report.byte_count += sent.byte_count;
                report.files.push_back(std::move(sent));
                break;
            }
            case storage::FolderEntry::Kind::FolderEnd:
                if (!send_packet(peer, protocol::FolderEndPayload{})) {
                    return local_failure(peer,
                                         entry.relative_path,
                                         transfer::TransferError::TransportUnavailable,
                                         "FOLDER_END could not be sent");
                }
                break;
        }
    }

    util::log_event(StructuredLogger::Level::Info,
                    "folder.send.complete",
                    {{"peer", mac_to_string(peer)},
                     {"folder", report.root},
                     {"files", std::to_string(report.files.size())},
                     {"bytes", std::to_string(report.byte_count)}});
    return report;
}

bool LinkNode::cancel_transfer(const MacAddress& peer) {
    return sender_.cancel(peer);
}

void LinkNode::on_transfer_complete(TransferCompleteHandler handler) {
    std::scoped_lock lock(handlers_mutex_);
    complete_handler_ = std::move(handler);
}

void LinkNode::set_text_handler(TextHandler handler) {
    std::scoped_lock lock(handlers_mutex_);
    text_handler_ = std::move(handler);
}

void LinkNode::set_progress_handler(transfer::FragmentSender::ProgressHandler handler) {
    sender_.set_progress_handler(std::move(handler));
}

void LinkNode::handle_frame(const network::InboundFrame& frame) {
    protocol::DecodeError error{};
    const auto packet = protocol::decode(frame.payload, &error);
    if (!packet.has_value()) {
        util::log_event(StructuredLogger::Level::Debug,
                        "transport.frame.malformed",
                        {{"peer", mac_to_string(frame.source)},
                         {"error", std::string(protocol::to_string(error))},
                         {"bytes", std::to_string(frame.payload.size())}});
        return;
    }

    const auto& peer = frame.source;
    if (const auto* ack = std::get_if<protocol::AckPayload>(&*packet)) {
        sender_.resolve(peer, transfer::AckEvent{ack->sequence, transfer::AckOutcome::Ack});
        return;
    }
    if (const auto* nack = std::get_if<protocol::NackPayload>(&*packet)) {
        sender_.resolve(peer, transfer::AckEvent{nack->sequence, transfer::AckOutcome::Nack});
        return;
    }
    if (const auto* text = std::get_if<protocol::TextPayload>(&*packet)) {
        handle_text(peer, *text);
        return;
    }
    if (const auto* request = std::get_if<protocol::DiscoveryRequestPayload>(&*packet)) {
        handle_discovery_request(peer, *request);
        return;
    }
    if (const auto* response = std::get_if<protocol::DiscoveryResponsePayload>(&*packet)) {
        remember_peer(peer, response->username);
        return;
    }
    if (const auto* folder = std::get_if<protocol::FolderStartPayload>(&*packet)) {
        handle_folder_start(peer, *folder);
        return;
    }
    if (std::holds_alternative<protocol::FolderEndPayload>(*packet)) {
        util::log_event(StructuredLogger::Level::Info, "folder.receive.end", {{"peer", mac_to_string(peer)}});
        return;
    }
    receiver_.handle_packet(peer, *packet);
}

void LinkNode::handle_text(const MacAddress& peer, const protocol::TextPayload& payload) {
    TextHandler handler;
    {
        std::scoped_lock lock(handlers_mutex_);
        handler = text_handler_;
    }
    util::log_event(StructuredLogger::Level::Debug,
                    "node.text.received",
                    {{"peer", mac_to_string(peer)}, {"bytes", std::to_string(payload.text.size())}});
    if (handler) {
        handler(peer, payload.text);
    }
}

void LinkNode::handle_discovery_request(const MacAddress& peer, const protocol::DiscoveryRequestPayload& payload) {
    remember_peer(peer, payload.username);
    if (!send_packet(peer, protocol::DiscoveryResponsePayload{config_.username})) {
        util::log_event(StructuredLogger::Level::Warning,
                        "node.discovery.reply_failed",
                        {{"peer", mac_to_string(peer)}});
    }
}

void LinkNode::handle_folder_start(const MacAddress& peer, const protocol::FolderStartPayload& payload) {
    util::log_event(StructuredLogger::Level::Info,
                    "folder.receive.start",
                    {{"peer", mac_to_string(peer)}, {"folder", payload.path}});
    if (directory_.has_value()) {
        directory_->create_folder(payload.path);
    }
}

void LinkNode::handle_received(const transfer::ReceiveReport& report) {
    if (!report.complete || report.failed) {
        return;
    }
    TransferCompleteHandler handler;
    {
        std::scoped_lock lock(handlers_mutex_);
        handler = complete_handler_;
    }
    if (handler) {
        handler(report.name, report.bytes_received, report.peer);
    }
}

void LinkNode::remember_peer(const MacAddress& peer, const std::string& username) {
    const auto key = mac_to_string(peer);
    bool added = false;
    {
        std::scoped_lock lock(peers_mutex_);
        auto [it, inserted] = peers_.try_emplace(key);
        added = inserted;
        it->second.address = peer;
        it->second.username = username;
        it->second.last_seen = std::chrono::steady_clock::now();
    }
    if (added) {
        util::log_event(StructuredLogger::Level::Info, "node.peer.discovered", {{"peer", key}, {"username", username}});
    }
}

bool LinkNode::send_packet(const MacAddress& peer, const protocol::Packet& packet) {
    if (!running_.load()) {
        return false;
    }
    ByteBuffer frame;
    try {
        frame = protocol::encode(packet);
    } catch (const std::length_error& error) {
        util::log_event(StructuredLogger::Level::Warning,
                        "node.packet.too_large",
                        {{"kind", std::string(protocol::to_string(protocol::kind_of(packet)))},
                         {"error", error.what()}});
        return false;
    }
    return transport_.send(peer, frame);
}

transfer::TransferFailure LinkNode::local_failure(const MacAddress& peer,
                                                  const std::string& name,
                                                  transfer::TransferError error,
                                                  std::string detail) const {
    transfer::TransferFailure failure{};
    failure.peer = peer;
    failure.name = name;
    failure.error = error;
    failure.detail = std::move(detail);
    util::log_event(StructuredLogger::Level::Error,
                    "transfer.send.failed",
                    {{"peer", mac_to_string(peer)},
                     {"file", name},
                     {"reason", std::string(transfer::to_string(error))},
                     {"detail", failure.detail}});
    return failure;
}

}  // namespace linkchat::core
