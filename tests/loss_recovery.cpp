#include "linkchat/protocol/Packet.hpp"
#include "test_support.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <map>

using namespace linkchat;
using namespace linkchat::transfer;
using namespace std::chrono_literals;
using linkchat::test::TransferPair;
using linkchat::test::file_data_sequence;
using linkchat::test::make_bytes;

namespace {

Config lossy_config() {
    Config config{};
    config.fragment_size = 256;
    config.ack_timeout = 60ms;
    config.max_retries = 5;
    return config;
}

}  // namespace

int main() {
    const auto bytes = make_bytes(1000, 3);

    // A fragment and its first retransmission are lost; the third copy gets through.
    {
        TransferPair pair(lossy_config());
        std::map<std::uint32_t, int> seen;
        pair.hub.set_hooks({[&seen](const MacAddress&, const MacAddress&, ByteBuffer& frame) {
            const auto sequence = file_data_sequence(frame);
            if (sequence == 1u) {
                return ++seen[*sequence] > 2;
            }
            return true;
        }});

        const auto result = pair.sender.send_file(pair.receiver_endpoint.local_address(), "lossy.bin", bytes);
        assert(succeeded(result));
        const auto& report = std::get<TransferReport>(result);
        assert(report.retransmissions == 2);
        assert(report.timeouts == 2);
        assert(report.fragment_count == 4);

        const auto received = pair.wait_for_report();
        assert(received.has_value() && received->complete);
        assert(received->duplicates == 0);
        assert(pair.store.file("lossy.bin") == bytes);
        assert(pair.hub.frames_dropped() == 2);
    }

    // A fragment corrupted in flight is NACKed and resent at once.
    {
        auto config = lossy_config();
        config.ack_timeout = 5s;
        TransferPair pair(config);
        std::atomic<bool> corrupted{false};
        pair.hub.set_hooks({[&corrupted](const MacAddress&, const MacAddress&, ByteBuffer& frame) {
            if (file_data_sequence(frame) == 2u && !corrupted.exchange(true)) {
                frame.back() ^= 0x5A;
            }
            return true;
        }});

        const auto started = std::chrono::steady_clock::now();
        const auto result = pair.sender.send_file(pair.receiver_endpoint.local_address(), "flipped.bin", bytes);
        assert(std::chrono::steady_clock::now() - started < 3s);
        assert(succeeded(result));
        const auto& report = std::get<TransferReport>(result);
        assert(report.nacks == 1 && report.retransmissions == 1 && report.timeouts == 0);

        const auto received = pair.wait_for_report();
        assert(received.has_value() && received->complete && received->corrupt == 1);
        assert(pair.store.file("flipped.bin") == bytes);
    }

    // A lost ACK causes a duplicate that is acknowledged again but written once.
    {
        TransferPair pair(lossy_config());
        const auto receiver_address = pair.receiver_endpoint.local_address();
        std::atomic<bool> dropped{false};
        pair.hub.set_hooks({[&dropped, receiver_address](const MacAddress& from, const MacAddress&, ByteBuffer& frame) {
            if (from != receiver_address) {
                return true;
            }
            const auto packet = protocol::decode(frame);
            if (packet.has_value() && std::holds_alternative<protocol::AckPayload>(*packet) &&
                std::get<protocol::AckPayload>(*packet).sequence == 0) {
                return dropped.exchange(true);
            }
            return true;
        }});

        const auto result = pair.sender.send_file(receiver_address, "ack_loss.bin", bytes);
        assert(succeeded(result));
        assert(std::get<TransferReport>(result).retransmissions == 1);

        const auto received = pair.wait_for_report();
        assert(received.has_value() && received->complete);
        assert(received->duplicates == 1);
        assert(received->fragments == 4);
        assert(pair.store.file("ack_loss.bin") == bytes);
    }

    // Nothing gets through: the transfer ends with the failing fragment named.
    {
        auto config = lossy_config();
        config.max_retries = 3;
        TransferPair pair(config);
        pair.hub.set_hooks({[](const MacAddress&, const MacAddress&, ByteBuffer& frame) {
            return file_data_sequence(frame) != 0u;
        }});
        const auto result = pair.sender.send_file(pair.receiver_endpoint.local_address(), "blocked.bin", bytes);
        const auto& failure = std::get<TransferFailure>(result);
        assert(failure.error == TransferError::RetryCeilingExceeded);
        assert(failure.failed_sequence == 0u);
        assert(failure.attempts == 3);
        assert(!failure.last_acked_sequence.has_value());
        assert(pair.receiver.open_transfers() == 1);
    }

    // The first transfer loses FILE_END and the next one loses FILE_START: the leftover receive state
    // must not acknowledge fragments of the new file.
    {
        TransferPair pair(lossy_config());
        std::atomic<int> starts{0};
        std::atomic<int> ends{0};
        pair.hub.set_hooks({[&starts, &ends](const MacAddress&, const MacAddress&, ByteBuffer& frame) {
            const auto packet = protocol::decode(frame);
            if (!packet.has_value()) {
                return true;
            }
            if (std::holds_alternative<protocol::FileEndPayload>(*packet)) {
                return ++ends != 1;
            }
            if (std::holds_alternative<protocol::FileStartPayload>(*packet)) {
                return ++starts != 2;
            }
            return true;
        }});

        const auto receiver_address = pair.receiver_endpoint.local_address();
        const auto first = pair.sender.send_file(receiver_address, "a.bin", bytes);
        assert(succeeded(first));
        assert(pair.receiver.open_transfers() == 1);

        const auto second_bytes = make_bytes(500, 11);
        const auto second = pair.sender.send_file(receiver_address, "b.bin", second_bytes);
        const auto* failure = std::get_if<TransferFailure>(&second);
        assert(failure != nullptr);
        assert(failure->error == TransferError::RetryCeilingExceeded);
        assert(failure->failed_sequence == 0u);
        assert(failure->attempts == 5);

        assert(!pair.store.file("b.bin").has_value());
        assert(pair.store.file("a.bin") == bytes);
        const auto leftover = pair.receiver.snapshot(pair.sender_endpoint.local_address());
        assert(leftover.has_value() && leftover->name == "a.bin" && leftover->duplicates == 0);
    }

    return 0;
}
