#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace linkchat {

using MacAddress = std::array<std::uint8_t, 6>;
using ByteBuffer = std::vector<std::uint8_t>;

inline constexpr MacAddress kBroadcastMac{0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};

std::string mac_to_string(const MacAddress& mac);
std::optional<MacAddress> mac_from_string(const std::string& text);

}  // namespace linkchat
