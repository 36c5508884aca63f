#pragma once

#include "linkchat/network/FrameTransport.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace linkchat::network {

inline constexpr std::size_t kEthernetHeaderSize = 14;
inline constexpr std::size_t kEthernetMinFrame = 60;
inline constexpr std::size_t kEthernetMtu = 1500;

// First non-loopback interface; throws std::runtime_error when none exists.
std::string find_default_interface();

// Linux AF_PACKET transport carrying link-chat packets under a private EtherType.
class RawSocketTransport final : public FrameTransport {
public:
    RawSocketTransport(std::string interface_name, std::uint16_t ether_type);
    ~RawSocketTransport() override;

    RawSocketTransport(const RawSocketTransport&) = delete;
    RawSocketTransport& operator=(const RawSocketTransport&) = delete;

    void start() override;
    void stop() override;

    bool send(const MacAddress& peer, std::span<const std::uint8_t> payload) override;
    void set_frame_handler(FrameHandler handler) override;

    MacAddress local_address() const override { return local_mac_; }
    std::size_t max_frame_payload() const noexcept override { return kEthernetMtu; }

    const std::string& interface_name() const noexcept { return interface_name_; }

private:
    void receive_loop();

    std::string interface_name_;
    std::uint16_t ether_type_{0};
    int interface_index_{0};
    MacAddress local_mac_{};
    int socket_{-1};

    std::atomic<bool> running_{false};
    std::thread reader_;
    std::mutex send_mutex_;
    std::mutex handler_mutex_;
    FrameHandler handler_{};
};

}  // namespace linkchat::network
