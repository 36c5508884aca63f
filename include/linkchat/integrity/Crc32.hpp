#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace linkchat::integrity {

inline constexpr std::size_t kDigestSize = 4;
using Digest = std::array<std::uint8_t, kDigestSize>;

// CRC-32 as used by IEEE 802.3 (reflected polynomial 0xEDB88320).
class Crc32 {
public:
    Crc32() = default;

    void update(std::span<const std::uint8_t> data);
    [[nodiscard]] std::uint32_t value() const noexcept;
    Digest finalize() const;

    static std::uint32_t compute(std::span<const std::uint8_t> data);
    static Digest digest(std::span<const std::uint8_t> data);

private:
    std::uint32_t state_{0xFFFFFFFFu};
};

Digest checksum(std::span<const std::uint8_t> data);
bool verify(std::span<const std::uint8_t> data, const Digest& expected);

}  // namespace linkchat::integrity
