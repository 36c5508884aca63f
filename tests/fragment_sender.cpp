#include "linkchat/protocol/Packet.hpp"
#include "linkchat/transfer/FragmentSender.hpp"
#include "test_support.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <map>
#include <thread>
#include <vector>

using namespace linkchat;
using namespace linkchat::transfer;
using namespace std::chrono_literals;
using linkchat::test::RecordingTransport;
using linkchat::test::count_sent;
using linkchat::test::make_bytes;
using linkchat::test::make_mac;

namespace {

Config fast_config(std::size_t fragment_size, std::uint32_t max_retries = 5,
                   std::chrono::milliseconds timeout = 50ms) {
    Config config{};
    config.fragment_size = fragment_size;
    config.max_retries = max_retries;
    config.ack_timeout = timeout;
    return config;
}

// Answers each FILE_DATA attempt through the script; unscripted attempts are ACKed.
enum class Reply { Ack, Nack, Silent };

void answer_with(RecordingTransport& transport,
                 FragmentSender& sender,
                 std::function<Reply(std::uint32_t sequence, std::uint32_t attempt)> script) {
    auto attempts = std::make_shared<std::map<std::uint32_t, std::uint32_t>>();
    transport.set_observer([&sender, attempts, script](const RecordingTransport::Sent& sent) {
        const auto* data = std::get_if<protocol::FileDataPayload>(&sent.packet);
        if (data == nullptr) {
            return;
        }
        const auto attempt = ++(*attempts)[data->sequence];
        switch (script(data->sequence, attempt)) {
            case Reply::Ack:
                sender.resolve(sent.peer, AckEvent{data->sequence, AckOutcome::Ack});
                break;
            case Reply::Nack:
                sender.resolve(sent.peer, AckEvent{data->sequence, AckOutcome::Nack});
                break;
            case Reply::Silent:
                break;
        }
    });
}

std::vector<std::uint32_t> data_sequences(const std::vector<RecordingTransport::Sent>& sent) {
    std::vector<std::uint32_t> sequences;
    for (const auto& entry : sent) {
        if (const auto* data = std::get_if<protocol::FileDataPayload>(&entry.packet)) {
            sequences.push_back(data->sequence);
        }
    }
    return sequences;
}

}  // namespace

int main() {
    const auto peer = make_mac(0x31);
    const auto bytes = make_bytes(2500, 7);

    // Stop-and-wait ordering: FILE_START, each fragment once, FILE_END.
    {
        RecordingTransport transport;
        FragmentSender sender(transport, fast_config(1000));
        answer_with(transport, sender, [](std::uint32_t, std::uint32_t) { return Reply::Ack; });

        std::vector<TransferProgress> progress;
        sender.set_progress_handler([&](const TransferProgress& update) { progress.push_back(update); });

        const auto result = sender.send_file(peer, "ordered.bin", bytes);
        assert(succeeded(result));
        const auto& report = std::get<TransferReport>(result);
        assert(report.byte_count == 2500);
        assert(report.fragment_count == 3);
        assert(report.transmissions == 3);
        assert(report.retransmissions == 0);

        const auto sent = transport.sent();
        assert(sent.size() == 5);
        const auto* start = std::get_if<protocol::FileStartPayload>(&sent.front().packet);
        assert(start != nullptr && start->name == "ordered.bin" && start->total_size == 2500);
        assert(std::holds_alternative<protocol::FileEndPayload>(sent.back().packet));
        assert((data_sequences(sent) == std::vector<std::uint32_t>{0, 1, 2}));
        assert(std::get<protocol::FileDataPayload>(sent[1].packet).data.size() == 1000);
        assert(std::get<protocol::FileDataPayload>(sent[3].packet).data.size() == 500);
        for (const auto& entry : sent) {
            assert(entry.peer == peer);
        }

        assert(progress.size() == 3);
        assert(progress.back().bytes_acked == 2500 && progress.back().fragments_acked == 3);
        assert(sender.active_transfers() == 0);
    }

    // A NACK triggers an immediate retransmission without waiting for the timeout.
    {
        RecordingTransport transport;
        FragmentSender sender(transport, fast_config(1000, 5, 2s));
        answer_with(transport, sender, [](std::uint32_t sequence, std::uint32_t attempt) {
            return sequence == 1 && attempt == 1 ? Reply::Nack : Reply::Ack;
        });

        const auto started = std::chrono::steady_clock::now();
        const auto result = sender.send_file(peer, "nack.bin", bytes);
        assert(std::chrono::steady_clock::now() - started < 1s);
        assert(succeeded(result));
        const auto& report = std::get<TransferReport>(result);
        assert(report.nacks == 1 && report.retransmissions == 1 && report.timeouts == 0);
        assert((data_sequences(transport.sent()) == std::vector<std::uint32_t>{0, 1, 1, 2}));
    }

    // A missing ACK is retransmitted after the timeout.
    {
        RecordingTransport transport;
        FragmentSender sender(transport, fast_config(1000));
        answer_with(transport, sender, [](std::uint32_t sequence, std::uint32_t attempt) {
            return sequence == 0 && attempt < 3 ? Reply::Silent : Reply::Ack;
        });
        const auto result = sender.send_file(peer, "timeout.bin", bytes);
        assert(succeeded(result));
        const auto& report = std::get<TransferReport>(result);
        assert(report.timeouts == 2 && report.retransmissions == 2);
        assert((data_sequences(transport.sent()) == std::vector<std::uint32_t>{0, 0, 0, 1, 2}));
    }

    // The retry ceiling aborts the transfer, names the fragment and skips FILE_END.
    {
        RecordingTransport transport;
        FragmentSender sender(transport, fast_config(1000, 3));
        answer_with(transport, sender, [](std::uint32_t sequence, std::uint32_t) {
            return sequence == 2 ? Reply::Silent : Reply::Ack;
        });
        const auto result = sender.send_file(peer, "ceiling.bin", bytes);
        assert(!succeeded(result));
        const auto& failure = std::get<TransferFailure>(result);
        assert(failure.error == TransferError::RetryCeilingExceeded);
        assert(failure.failed_sequence == 2u);
        assert(failure.last_acked_sequence == 1u);
        assert(failure.attempts == 3);
        assert(failure.last_cause == TransferError::AckTimeout);
        assert(failure.name == "ceiling.bin");
        assert(!failure.describe().empty());

        const auto sent = transport.sent();
        assert(count_sent<protocol::FileEndPayload>(sent) == 0);
        assert((data_sequences(sent) == std::vector<std::uint32_t>{0, 1, 2, 2, 2}));
        assert(sender.active_transfers() == 0);
    }

    {
        RecordingTransport transport;
        FragmentSender sender(transport, fast_config(1000, 2));
        answer_with(transport, sender, [](std::uint32_t, std::uint32_t) { return Reply::Nack; });
        const auto result = sender.send_file(peer, "nacked.bin", bytes);
        const auto& failure = std::get<TransferFailure>(result);
        assert(failure.error == TransferError::RetryCeilingExceeded);
        assert(failure.last_cause == TransferError::NegativeAcknowledged);
        assert(!failure.last_acked_sequence.has_value());
    }

    // Transport failure is terminal and immediate.
    {
        RecordingTransport transport;
        transport.set_available(false);
        FragmentSender sender(transport, fast_config(1000));
        const auto result = sender.send_file(peer, "down.bin", bytes);
        assert(std::get<TransferFailure>(result).error == TransferError::TransportUnavailable);
        assert(transport.sent().empty());
    }

    {
        RecordingTransport transport;
        FragmentSender sender(transport, fast_config(1000));
        answer_with(transport, sender, [&transport](std::uint32_t sequence, std::uint32_t) {
            if (sequence == 0) {
                transport.set_available(false);
            }
            return Reply::Ack;
        });
        const auto started = std::chrono::steady_clock::now();
        const auto result = sender.send_file(peer, "unplugged.bin", bytes);
        const auto& failure = std::get<TransferFailure>(result);
        assert(failure.error == TransferError::TransportUnavailable);
        assert(failure.failed_sequence == 1u);
        assert(failure.attempts == 1);
        assert(std::chrono::steady_clock::now() - started < 1s);
    }

    // Acknowledgments for other sequences do not resolve the fragment in flight.
    {
        RecordingTransport transport;
        FragmentSender sender(transport, fast_config(1000, 5, 2s));
        transport.set_observer([&sender](const RecordingTransport::Sent& sent) {
            if (const auto* data = std::get_if<protocol::FileDataPayload>(&sent.packet)) {
                if (data->sequence > 0) {
                    sender.resolve(sent.peer, AckEvent{data->sequence - 1, AckOutcome::Ack});
                    sender.resolve(sent.peer, AckEvent{data->sequence + 1, AckOutcome::Nack});
                }
                sender.resolve(sent.peer, AckEvent{data->sequence, AckOutcome::Ack});
            }
        });
        const auto result = sender.send_file(peer, "stale.bin", bytes);
        assert(succeeded(result));
        assert(std::get<TransferReport>(result).retransmissions == 0);
    }

    // One transfer per peer at a time; cancel ends the one in flight.
    {
        RecordingTransport transport;
        FragmentSender sender(transport, fast_config(1000, 5, 10s));
        std::atomic<bool> done{false};
        TransferResult first = TransferFailure{};
        std::thread worker([&] {
            first = sender.send_file(peer, "slow.bin", bytes);
            done = true;
        });
        assert(linkchat::test::wait_until([&] { return sender.active_transfers() == 1; }));

        const auto busy = sender.send_file(peer, "second.bin", bytes);
        assert(std::get<TransferFailure>(busy).error == TransferError::PeerBusy);
        assert(!sender.resolve(make_mac(0x99), AckEvent{0, AckOutcome::Ack}));
        assert(!sender.cancel(make_mac(0x99)));

        assert(sender.cancel(peer));
        worker.join();
        assert(done);
        const auto& failure = std::get<TransferFailure>(first);
        assert(failure.error == TransferError::Cancelled);
        assert(failure.failed_sequence == 0u);
        assert(sender.active_transfers() == 0);
    }

    // Argument validation happens before anything is sent.
    {
        RecordingTransport transport(make_mac(0xEE), 100);
        FragmentSender sender(transport, fast_config(1024));
        assert(sender.max_fragment_size() == 100 - protocol::kHeaderSize - protocol::kFileDataOverhead);
        assert(std::get<TransferFailure>(sender.send_file(peer, "big.bin", bytes)).error ==
               TransferError::InvalidArgument);
        assert(std::get<TransferFailure>(sender.send_file(peer, "", bytes)).error == TransferError::InvalidArgument);
        assert(transport.sent().empty());
    }

    // Empty files are FILE_START followed by FILE_END.
    {
        RecordingTransport transport;
        FragmentSender sender(transport, fast_config(1000));
        const auto result = sender.send_file(peer, "empty.bin", {});
        assert(succeeded(result));
        assert(std::get<TransferReport>(result).fragment_count == 0);
        const auto sent = transport.sent();
        assert(sent.size() == 2);
        assert(std::holds_alternative<protocol::FileStartPayload>(sent[0].packet));
        assert(std::holds_alternative<protocol::FileEndPayload>(sent[1].packet));
    }

    return 0;
}
