#include "linkchat/network/RawSocketTransport.hpp"

#include "linkchat/protocol/Packet.hpp"
#include "linkchat/util/StructuredLogger.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <linux/if_packet.h>
#include <net/ethernet.h>
#include <net/if.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace linkchat::network {

namespace {

constexpr int kPollIntervalMs = 200;

using util::StructuredLogger;

int open_control_socket() {
    const int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        throw std::runtime_error("Failed to open control socket: " + std::string(std::strerror(errno)));
    }
    return fd;
}

MacAddress query_hardware_address(const std::string& interface_name) {
    const int fd = open_control_socket();
    ifreq request{};
    std::strncpy(request.ifr_name, interface_name.c_str(), IFNAMSIZ - 1);
    const int result = ::ioctl(fd, SIOCGIFHWADDR, &request);
    const int error = errno;
    ::close(fd);
    if (result < 0) {
        throw std::runtime_error("Failed to read MAC address of " + interface_name + ": " + std::strerror(error));
    }
    MacAddress mac{};
    std::memcpy(mac.data(), request.ifr_hwaddr.sa_data, mac.size());
    return mac;
}

}  // namespace

std::string find_default_interface() {
    struct if_nameindex* interfaces = ::if_nameindex();
    if (interfaces == nullptr) {
        throw std::runtime_error("Failed to enumerate network interfaces");
    }
    std::string selected;
    for (auto* entry = interfaces; entry->if_index != 0 && entry->if_name != nullptr; ++entry) {
        if (std::string_view(entry->if_name) != "lo") {
            selected = entry->if_name;
            break;
        }
    }
    ::if_freenameindex(interfaces);
    if (selected.empty()) {
        throw std::runtime_error("No usable network interface found (only loopback is available)");
    }
    return selected;
}

RawSocketTransport::RawSocketTransport(std::string interface_name, std::uint16_t ether_type)
    : interface_name_(std::move(interface_name)), ether_type_(ether_type) {}

RawSocketTransport::~RawSocketTransport() {
    stop();
}

void RawSocketTransport::start() {
    if (running_) {
        return;
    }

    interface_index_ = static_cast<int>(::if_nametoindex(interface_name_.c_str()));
    if (interface_index_ == 0) {
        throw std::runtime_error("Unknown network interface: " + interface_name_);
    }
    local_mac_ = query_hardware_address(interface_name_);

    const int fd = ::socket(AF_PACKET, SOCK_RAW, htons(ether_type_));
    if (fd < 0) {
        const int error = errno;
        if (error == EPERM || error == EACCES) {
            throw std::runtime_error("Raw sockets require root or CAP_NET_RAW");
        }
        throw std::runtime_error("Failed to create raw socket: " + std::string(std::strerror(error)));
    }

    sockaddr_ll address{};
    address.sll_family = AF_PACKET;
    address.sll_protocol = htons(ether_type_);
    address.sll_ifindex = interface_index_;
    if (::bind(fd, reinterpret_cast<const sockaddr*>(&address), sizeof(address)) < 0) {
        const int error = errno;
        ::close(fd);
        throw std::runtime_error("Failed to bind raw socket to " + interface_name_ + ": " + std::strerror(error));
    }

    socket_ = fd;
    running_ = true;
    reader_ = std::thread(&RawSocketTransport::receive_loop, this);

    util::log_event(StructuredLogger::Level::Info,
                    "transport.raw.started",
                    {{"interface", interface_name_}, {"mac", mac_to_string(local_mac_)}});
}

void RawSocketTransport::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (reader_.joinable()) {
        reader_.join();
    }
    ::close(socket_);
    socket_ = -1;
}

bool RawSocketTransport::send(const MacAddress& peer, std::span<const std::uint8_t> payload) {
    if (!running_ || payload.size() > kEthernetMtu) {
        return false;
    }

    std::vector<std::uint8_t> frame;
    frame.reserve(std::max(kEthernetMinFrame, kEthernetHeaderSize + payload.size()));
    frame.insert(frame.end(), peer.begin(), peer.end());
    frame.insert(frame.end(), local_mac_.begin(), local_mac_.end());
    frame.push_back(static_cast<std::uint8_t>((ether_type_ >> 8) & 0xFFu));
    frame.push_back(static_cast<std::uint8_t>(ether_type_ & 0xFFu));
    frame.insert(frame.end(), payload.begin(), payload.end());
    if (frame.size() < kEthernetMinFrame) {
        frame.resize(kEthernetMinFrame, 0);
    }

    sockaddr_ll destination{};
    destination.sll_family = AF_PACKET;
    destination.sll_protocol = htons(ether_type_);
    destination.sll_ifindex = interface_index_;
    destination.sll_halen = ETH_ALEN;
    std::memcpy(destination.sll_addr, peer.data(), peer.size());

    std::scoped_lock lock(send_mutex_);
    const auto sent = ::sendto(socket_,
                               frame.data(),
                               frame.size(),
                               0,
                               reinterpret_cast<const sockaddr*>(&destination),
                               sizeof(destination));
    if (sent < 0 || static_cast<std::size_t>(sent) != frame.size()) {
        util::log_event(StructuredLogger::Level::Error,
                        "transport.raw.send_failed",
                        {{"peer", mac_to_string(peer)}, {"error", std::strerror(errno)}});
        return false;
    }
    return true;
}

void RawSocketTransport::set_frame_handler(FrameHandler handler) {
    std::scoped_lock lock(handler_mutex_);
    handler_ = std::move(handler);
}

void RawSocketTransport::receive_loop() {
    std::array<std::uint8_t, 65536> buffer{};
    while (running_) {
        pollfd descriptor{};
        descriptor.fd = socket_;
        descriptor.events = POLLIN;
        const int ready = ::poll(&descriptor, 1, kPollIntervalMs);
        if (ready <= 0) {
            if (ready < 0 && errno != EINTR) {
                util::log_event(StructuredLogger::Level::Error,
                                "transport.raw.poll_failed",
                                {{"error", std::strerror(errno)}});
                return;
            }
            continue;
        }

        const auto received = ::recv(socket_, buffer.data(), buffer.size(), 0);
        if (received < static_cast<ssize_t>(kEthernetHeaderSize)) {
            continue;
        }

        const auto ether_type = static_cast<std::uint16_t>((buffer[12] << 8) | buffer[13]);
        if (ether_type != ether_type_) {
            continue;
        }

        InboundFrame frame{};
        std::memcpy(frame.source.data(), buffer.data() + 6, frame.source.size());
        if (frame.source == local_mac_) {
            continue;
        }

        auto body = std::span<const std::uint8_t>(buffer.data() + kEthernetHeaderSize,
                                                  static_cast<std::size_t>(received) - kEthernetHeaderSize);
        // Short frames arrive padded to the Ethernet minimum; the link-chat header knows the real size.
        if (const auto framed = protocol::framed_size(body)) {
            body = body.first(*framed);
        }
        frame.payload.assign(body.begin(), body.end());

        FrameHandler handler;
        {
            std::scoped_lock lock(handler_mutex_);
            handler = handler_;
        }
        if (handler) {
            handler(frame);
        }
    }
}

}  // namespace linkchat::network
