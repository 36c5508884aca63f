#include "linkchat/integrity/Crc32.hpp"

namespace linkchat::integrity {

namespace {

constexpr std::uint32_t kPolynomial = 0xEDB88320u;

constexpr std::array<std::uint32_t, 256> make_table() {
    std::array<std::uint32_t, 256> table{};
    for (std::uint32_t index = 0; index < table.size(); ++index) {
        std::uint32_t crc = index;
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 1u) != 0 ? (crc >> 1) ^ kPolynomial : crc >> 1;
        }
        table[index] = crc;
    }
    return table;
}

constexpr auto kTable = make_table();

}  // namespace

void Crc32::update(std::span<const std::uint8_t> data) {
    auto crc = state_;
    for (const auto byte : data) {
        crc = kTable[(crc ^ byte) & 0xFFu] ^ (crc >> 8);
    }
    state_ = crc;
}

std::uint32_t Crc32::value() const noexcept {
    return state_ ^ 0xFFFFFFFFu;
}

Digest Crc32::finalize() const {
    const auto crc = value();
    return Digest{static_cast<std::uint8_t>((crc >> 24) & 0xFFu),
                  static_cast<std::uint8_t>((crc >> 16) & 0xFFu),
                  static_cast<std::uint8_t>((crc >> 8) & 0xFFu),
                  static_cast<std::uint8_t>(crc & 0xFFu)};
}

std::uint32_t Crc32::compute(std::span<const std::uint8_t> data) {
    Crc32 crc;
    crc.update(data);
    return crc.value();
}

Digest Crc32::digest(std::span<const std::uint8_t> data) {
    Crc32 crc;
    crc.update(data);
    return crc.finalize();
}

Digest checksum(std::span<const std::uint8_t> data) {
    return Crc32::digest(data);
}

bool verify(std::span<const std::uint8_t> data, const Digest& expected) {
    return Crc32::digest(data) == expected;
}

}  // namespace linkchat::integrity
