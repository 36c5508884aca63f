#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace linkchat {

struct Config {
    std::size_t fragment_size{1024};
    std::chrono::milliseconds ack_timeout{std::chrono::milliseconds(500)};
    std::uint32_t max_retries{5};
    std::string interface_name{};
    std::uint16_t ether_type{0x1234};
    std::string receive_directory{"received"};
    std::string username{"linkchat"};
    bool logging{true};
    std::string log_level{"info"};
};

}  // namespace linkchat
