#include "linkchat/core/LinkNode.hpp"
#include "linkchat/network/LoopbackTransport.hpp"
#include "linkchat/storage/ReceiveDirectory.hpp"
#include "test_support.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

using namespace linkchat;
using namespace std::chrono_literals;
using linkchat::test::make_bytes;
using linkchat::test::make_mac;
using linkchat::test::wait_until;

namespace {

struct Received {
    std::string name;
    std::uint64_t bytes{0};
    MacAddress peer{};
};

std::filesystem::path make_temp_dir(const std::string& name) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto path = std::filesystem::temp_directory_path() / (name + "_" + std::to_string(stamp));
    std::filesystem::create_directories(path);
    return path;
}

void write_bytes(const std::filesystem::path& path, const ByteBuffer& bytes) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

Config node_config(const std::string& username, const std::filesystem::path& inbox) {
    Config config{};
    config.username = username;
    config.receive_directory = inbox.string();
    config.fragment_size = 700;
    config.ack_timeout = 80ms;
    return config;
}

}  // namespace

int main() {
    const auto workspace = make_temp_dir("linkchat_link_node");
    network::LoopbackHub hub;
    network::LoopbackTransport alice_link(hub, make_mac(0x0A));
    network::LoopbackTransport bob_link(hub, make_mac(0x0B));

    core::LinkNode alice(alice_link, node_config("alice", workspace / "alice_inbox"));
    core::LinkNode bob(bob_link, node_config("bob", workspace / "bob_inbox"));

    // Nothing leaves a stopped node.
    assert(!alice.send_text(bob_link.local_address(), "early"));
    assert(std::get<transfer::TransferFailure>(alice.send_file_bytes(bob_link.local_address(), "x", make_bytes(4)))
               .error == transfer::TransferError::TransportUnavailable);

    std::mutex mutex;
    std::vector<std::pair<MacAddress, std::string>> messages;
    std::vector<Received> received;
    bob.set_text_handler([&](const MacAddress& peer, const std::string& text) {
        std::scoped_lock lock(mutex);
        messages.emplace_back(peer, text);
    });
    bob.on_transfer_complete([&](const std::string& name, std::uint64_t bytes, const MacAddress& peer) {
        std::scoped_lock lock(mutex);
        received.push_back(Received{name, bytes, peer});
    });

    alice.start();
    bob.start();
    assert(alice.running() && bob.running());
    assert(alice.address() == make_mac(0x0A));

    // Text delivery.
    {
        assert(alice.send_text(bob.address(), "hello bob"));
        assert(wait_until([&] {
            std::scoped_lock lock(mutex);
            return !messages.empty();
        }));
        std::scoped_lock lock(mutex);
        assert(messages.front().first == alice.address());
        assert(messages.front().second == "hello bob");
    }

    // Discovery fills both peer tables.
    {
        assert(alice.known_peers().empty());
        assert(alice.discover());
        assert(wait_until([&] { return alice.find_peer("bob").has_value(); }));
        assert(alice.find_peer("bob")->address == bob.address());
        assert(bob.find_peer("alice").has_value());
        assert(alice.known_peers().size() == 1);
        assert(!alice.find_peer("carol").has_value());
    }

    // In-memory bytes arrive as a file in the receive directory.
    {
        const auto bytes = make_bytes(5000, 11);
        std::vector<transfer::TransferProgress> progress;
        alice.set_progress_handler([&](const transfer::TransferProgress& update) { progress.push_back(update); });
        const auto result = alice.send_file_bytes(bob.address(), "memo.bin", bytes);
        alice.set_progress_handler({});
        assert(transfer::succeeded(result));
        assert(std::get<transfer::TransferReport>(result).fragment_count == 8);
        assert(progress.size() == 8);

        assert(wait_until([&] {
            std::scoped_lock lock(mutex);
            return received.size() == 1;
        }));
        {
            std::scoped_lock lock(mutex);
            assert(received[0].name == "memo.bin");
            assert(received[0].bytes == 5000);
            assert(received[0].peer == alice.address());
        }
        assert(storage::read_file_bytes(workspace / "bob_inbox" / "memo.bin") == bytes);
    }

    // Files on disk are sent under their own name.
    {
        const auto source = workspace / "outbox" / "photo.raw";
        const auto bytes = make_bytes(1234, 5);
        write_bytes(source, bytes);
        assert(transfer::succeeded(alice.send_file(bob.address(), source)));
        assert(wait_until([&] {
            std::scoped_lock lock(mutex);
            return received.size() == 2;
        }));
        assert(storage::read_file_bytes(workspace / "bob_inbox" / "photo.raw") == bytes);

        const auto missing = alice.send_file(bob.address(), workspace / "outbox" / "missing.raw");
        assert(std::get<transfer::TransferFailure>(missing).error == transfer::TransferError::InvalidArgument);
    }

    // Folders are recreated with their structure.
    {
        const auto tree = workspace / "outbox" / "album";
        const auto cover = make_bytes(2000, 1);
        const auto track = make_bytes(10, 2);
        write_bytes(tree / "cover.jpg", cover);
        write_bytes(tree / "disc1" / "track01.flac", track);
        std::filesystem::create_directories(tree / "extras");

        const auto result = alice.send_folder(bob.address(), tree);
        assert(std::holds_alternative<core::FolderReport>(result));
        const auto& report = std::get<core::FolderReport>(result);
        assert(report.root == "album");
        assert(report.files.size() == 2);
        assert(report.folders == 3);
        assert(report.byte_count == cover.size() + track.size());

        assert(wait_until([&] {
            std::scoped_lock lock(mutex);
            return received.size() == 4;
        }));
        const auto inbox = workspace / "bob_inbox";
        assert(storage::read_file_bytes(inbox / "album" / "cover.jpg") == cover);
        assert(storage::read_file_bytes(inbox / "album" / "disc1" / "track01.flac") == track);
        assert(wait_until([&] { return std::filesystem::is_directory(inbox / "album" / "extras"); }));

        const auto missing = alice.send_folder(bob.address(), workspace / "no_such_folder");
        assert(std::get<transfer::TransferFailure>(missing).error == transfer::TransferError::InvalidArgument);
    }

    // Garbage frames are dropped without disturbing the node.
    {
        network::LoopbackTransport noise(hub, make_mac(0x0C));
        noise.start();
        const ByteBuffer garbage{0x42, 0x00, 0x05, 0x01};
        assert(noise.send(bob.address(), garbage));
        noise.stop();

        assert(alice.send_text(bob.address(), "still here"));
        assert(wait_until([&] {
            std::scoped_lock lock(mutex);
            return messages.size() == 2;
        }));
    }

    // Sending to a silent MAC fails after the retry ceiling.
    {
        const auto result = alice.send_file_bytes(make_mac(0x7F), "void.bin", make_bytes(10));
        const auto& failure = std::get<transfer::TransferFailure>(result);
        assert(failure.error == transfer::TransferError::RetryCeilingExceeded);
        assert(failure.failed_sequence == 0u);
        assert(!alice.cancel_transfer(make_mac(0x7F)));
    }

    alice.stop();
    bob.stop();
    assert(!alice.running());
    assert(!alice.send_text(bob_link.local_address(), "late"));

    std::filesystem::remove_all(workspace);
    return 0;
}
