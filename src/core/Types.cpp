#include "linkchat/Types.hpp"

#include <iomanip>
#include <optional>
#include <sstream>

namespace linkchat {

namespace {
std::string to_hex(const std::uint8_t value) {
    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setw(2) << std::setfill('0') << static_cast<int>(value);
    return oss.str();
}

int hex_digit(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return 10 + (ch - 'a');
    }
    if (ch >= 'A' && ch <= 'F') {
        return 10 + (ch - 'A');
    }
    return -1;
}

}  // namespace

std::string mac_to_string(const MacAddress& mac) {
    std::string text;
    text.reserve(mac.size() * 3);
    for (std::size_t index = 0; index < mac.size(); ++index) {
        if (index != 0) {
            text.push_back(':');
        }
        text.append(to_hex(mac[index]));
    }
    return text;
}

// Accepts "aa:bb:cc:dd:ee:ff", "aa-bb-cc-dd-ee-ff" and the bare 12 digit form.
std::optional<MacAddress> mac_from_string(const std::string& text) {
    std::string digits;
    digits.reserve(12);
    for (const char ch : text) {
        if (ch == ':' || ch == '-') {
            continue;
        }
        digits.push_back(ch);
    }
    if (digits.size() != MacAddress{}.size() * 2) {
        return std::nullopt;
    }
    if (text.size() != digits.size() && text.size() != digits.size() + 5) {
        return std::nullopt;
    }

    MacAddress mac{};
    for (std::size_t index = 0; index < mac.size(); ++index) {
        const auto high = hex_digit(digits[index * 2]);
        const auto low = hex_digit(digits[index * 2 + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        mac[index] = static_cast<std::uint8_t>((high << 4) | low);
    }
    return mac;
}

}  // namespace linkchat
