#include "linkchat/transfer/FragmentReceiver.hpp"

#include "linkchat/integrity/Crc32.hpp"
#include "linkchat/util/StructuredLogger.hpp"

#include <utility>
#include <variant>

namespace linkchat::transfer {

namespace {

using util::StructuredLogger;

void close_sink(std::unique_ptr<OutputSink>& sink) {
    if (sink && !sink->close()) {
        util::log_event(StructuredLogger::Level::Warning, "transfer.receive.close_failed");
    }
    sink.reset();
}

}  // namespace

std::string_view to_string(ReceiveDisposition disposition) noexcept {
    switch (disposition) {
        case ReceiveDisposition::Ignored:
            return "ignored";
        case ReceiveDisposition::Malformed:
            return "malformed";
        case ReceiveDisposition::Opened:
            return "opened";
        case ReceiveDisposition::Accepted:
            return "accepted";
        case ReceiveDisposition::Duplicate:
            return "duplicate";
        case ReceiveDisposition::Corrupt:
            return "corrupt";
        case ReceiveDisposition::OutOfOrder:
            return "out_of_order";
        case ReceiveDisposition::Completed:
            return "completed";
        case ReceiveDisposition::Failed:
            return "failed";
    }
    return "unknown";
}

FragmentReceiver::FragmentReceiver(network::FrameTransport& transport, SinkFactory sink_factory)
    : transport_(transport), sink_factory_(std::move(sink_factory)) {}

FragmentReceiver::~FragmentReceiver() {
    std::scoped_lock lock(transfers_mutex_);
    for (auto& [key, transfer] : transfers_) {
        close_sink(transfer.sink);
    }
    transfers_.clear();
}

void FragmentReceiver::set_completion_handler(CompletionHandler handler) {
    std::scoped_lock lock(handler_mutex_);
    completion_handler_ = std::move(handler);
}

std::size_t FragmentReceiver::open_transfers() const {
    std::scoped_lock lock(transfers_mutex_);
    return transfers_.size();
}

std::optional<ReceiveReport> FragmentReceiver::snapshot(const MacAddress& peer) const {
    std::scoped_lock lock(transfers_mutex_);
    const auto it = transfers_.find(mac_to_string(peer));
    if (it == transfers_.end()) {
        return std::nullopt;
    }
    return make_report(it->second);
}

bool FragmentReceiver::abandon(const MacAddress& peer) {
    std::scoped_lock lock(transfers_mutex_);
    const auto it = transfers_.find(mac_to_string(peer));
    if (it == transfers_.end()) {
        return false;
    }
    close_sink(it->second.sink);
    util::log_event(StructuredLogger::Level::Warning,
                    "transfer.receive.abandoned",
                    {{"peer", mac_to_string(peer)}, {"file", it->second.name}});
    transfers_.erase(it);
    return true;
}

ReceiveDisposition FragmentReceiver::handle_inbound(const MacAddress& peer, std::span<const std::uint8_t> frame) {
    protocol::DecodeError error{};
    const auto packet = protocol::decode(frame, &error);
    if (!packet.has_value()) {
        util::log_event(StructuredLogger::Level::Debug,
                        "transport.frame.malformed",
                        {{"peer", mac_to_string(peer)},
                         {"error", std::string(protocol::to_string(error))},
                         {"bytes", std::to_string(frame.size())}});
        return ReceiveDisposition::Malformed;
    }
    return handle_packet(peer, *packet);
}

ReceiveDisposition FragmentReceiver::handle_packet(const MacAddress& peer, const protocol::Packet& packet) {
    if (const auto* start = std::get_if<protocol::FileStartPayload>(&packet)) {
        return handle_file_start(peer, *start);
    }
    if (const auto* data = std::get_if<protocol::FileDataPayload>(&packet)) {
        return handle_file_data(peer, *data);
    }
    if (std::holds_alternative<protocol::FileEndPayload>(packet)) {
        return handle_file_end(peer);
    }
    return ReceiveDisposition::Ignored;
}

ReceiveDisposition FragmentReceiver::handle_file_start(const MacAddress& peer,
                                                       const protocol::FileStartPayload& payload) {
    const auto key = mac_to_string(peer);
    std::optional<ReceiveReport> superseded;
    {
        std::scoped_lock lock(transfers_mutex_);
        const auto existing = transfers_.find(key);
        if (existing != transfers_.end()) {
            superseded = make_report(existing->second);
            superseded->failed = true;
            close_sink(existing->second.sink);
            transfers_.erase(existing);
        }
    }
    if (superseded.has_value()) {
        util::log_event(StructuredLogger::Level::Warning,
                        "transfer.receive.superseded",
                        {{"peer", key},
                         {"file", superseded->name},
                         {"bytes", std::to_string(superseded->bytes_received)}});
        notify_completion(*superseded);
    }

    auto sink = sink_factory_ ? sink_factory_(peer, payload.name) : nullptr;
    if (!sink) {
        util::log_event(StructuredLogger::Level::Error,
                        "transfer.receive.sink_failed",
                        {{"peer", key}, {"file", payload.name}});
        return ReceiveDisposition::Failed;
    }

    InboundTransfer transfer{};
    transfer.peer = peer;
    transfer.name = payload.name;
    transfer.expected_size = payload.total_size;
    transfer.sink = std::move(sink);
    transfer.opened_at = std::chrono::steady_clock::now();
    {
        std::scoped_lock lock(transfers_mutex_);
        transfers_.insert_or_assign(key, std::move(transfer));
    }

    util::log_event(StructuredLogger::Level::Info,
                    "transfer.receive.start",
                    {{"peer", key}, {"file", payload.name}, {"bytes", std::to_string(payload.total_size)}});
    return ReceiveDisposition::Opened;
}

ReceiveDisposition FragmentReceiver::handle_file_data(const MacAddress& peer,
                                                      const protocol::FileDataPayload& payload) {
    const auto key = mac_to_string(peer);
    ReceiveDisposition disposition = ReceiveDisposition::Ignored;
    std::optional<ReceiveReport> failed_report;
    {
        std::scoped_lock lock(transfers_mutex_);
        const auto it = transfers_.find(key);
        if (it == transfers_.end()) {
            return ReceiveDisposition::Ignored;
        }
        auto& transfer = it->second;

        if (!integrity::verify(payload.data, payload.checksum)) {
            ++transfer.corrupt;
            disposition = ReceiveDisposition::Corrupt;
        } else if (transfer.next_sequence > 0 && payload.sequence == transfer.next_sequence - 1) {
            // Stop-and-wait only ever repeats the last accepted fragment.
            ++transfer.duplicates;
            disposition = ReceiveDisposition::Duplicate;
        } else if (payload.sequence != transfer.next_sequence) {
            disposition = ReceiveDisposition::OutOfOrder;
        } else if (!transfer.sink->write(payload.data)) {
            failed_report = make_report(transfer);
            failed_report->failed = true;
            close_sink(transfer.sink);
            transfers_.erase(it);
            disposition = ReceiveDisposition::Failed;
        } else {
            transfer.bytes_written += payload.data.size();
            ++transfer.next_sequence;
            disposition = ReceiveDisposition::Accepted;
        }
    }

    switch (disposition) {
        case ReceiveDisposition::Accepted:
        case ReceiveDisposition::Duplicate:
            // Duplicates are re-acknowledged: the earlier ACK may have been lost.
            respond(peer, protocol::AckPayload{payload.sequence});
            break;
        case ReceiveDisposition::Corrupt:
            util::log_event(StructuredLogger::Level::Warning,
                            "transfer.fragment.corrupt",
                            {{"peer", key}, {"sequence", std::to_string(payload.sequence)}});
            respond(peer, protocol::NackPayload{payload.sequence});
            break;
        case ReceiveDisposition::OutOfOrder:
            util::log_event(StructuredLogger::Level::Warning,
                            "transfer.fragment.out_of_order",
                            {{"peer", key}, {"sequence", std::to_string(payload.sequence)}});
            break;
        case ReceiveDisposition::Failed:
            util::log_event(StructuredLogger::Level::Error,
                            "transfer.receive.write_failed",
                            {{"peer", key}, {"sequence", std::to_string(payload.sequence)}});
            notify_completion(*failed_report);
            break;
        default:
            break;
    }
    return disposition;
}

ReceiveDisposition FragmentReceiver::handle_file_end(const MacAddress& peer) {
    const auto key = mac_to_string(peer);
    ReceiveReport report{};
    std::chrono::milliseconds elapsed{0};
    {
        std::scoped_lock lock(transfers_mutex_);
        const auto it = transfers_.find(key);
        if (it == transfers_.end()) {
            return ReceiveDisposition::Ignored;
        }
        auto& transfer = it->second;
        close_sink(transfer.sink);
        transfer.closed = true;
        report = make_report(transfer);
        elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                        transfer.opened_at);
        transfers_.erase(it);
    }

    if (report.complete) {
        util::log_event(StructuredLogger::Level::Info,
                        "transfer.receive.complete",
                        {{"peer", key},
                         {"file", report.name},
                         {"bytes", std::to_string(report.bytes_received)},
                         {"fragments", std::to_string(report.fragments)},
                         {"elapsed_ms", std::to_string(elapsed.count())}});
    } else {
        util::log_event(StructuredLogger::Level::Warning,
                        "transfer.receive.size_mismatch",
                        {{"peer", key},
                         {"file", report.name},
                         {"expected", std::to_string(report.expected_size)},
                         {"received", std::to_string(report.bytes_received)}});
    }
    notify_completion(report);
    return ReceiveDisposition::Completed;
}

ReceiveReport FragmentReceiver::make_report(const InboundTransfer& transfer) {
    ReceiveReport report{};
    report.peer = transfer.peer;
    report.name = transfer.name;
    report.expected_size = transfer.expected_size;
    report.bytes_received = transfer.bytes_written;
    report.fragments = transfer.next_sequence;
    report.duplicates = transfer.duplicates;
    report.corrupt = transfer.corrupt;
    report.complete = transfer.closed && transfer.bytes_written == transfer.expected_size;
    return report;
}

void FragmentReceiver::respond(const MacAddress& peer, const protocol::Packet& packet) {
    if (!transport_.send(peer, protocol::encode(packet))) {
        util::log_event(StructuredLogger::Level::Error,
                        "transfer.receive.respond_failed",
                        {{"peer", mac_to_string(peer)},
                         {"kind", std::string(protocol::to_string(protocol::kind_of(packet)))}});
    }
}

void FragmentReceiver::notify_completion(const ReceiveReport& report) {
    CompletionHandler handler;
    {
        std::scoped_lock lock(handler_mutex_);
        handler = completion_handler_;
    }
    if (handler) {
        handler(report);
    }
}

}  // namespace linkchat::transfer
