#pragma once

#include "linkchat/Types.hpp"
#include "linkchat/integrity/Crc32.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace linkchat::protocol {

inline constexpr std::size_t kHeaderSize = 3;
inline constexpr std::size_t kMaxPayloadSize = 0xFFFF;
inline constexpr std::size_t kSequenceSize = 4;
inline constexpr std::size_t kFileDataOverhead = kSequenceSize + integrity::kDigestSize;

enum class PacketKind : std::uint8_t {
    Text = 0x01,
    FileStart = 0x02,
    FileData = 0x03,
    FileEnd = 0x04,
    DiscoveryRequest = 0x05,
    DiscoveryResponse = 0x06,
    Ack = 0x07,
    Nack = 0x08,
    FolderStart = 0x09,
    FolderEnd = 0x0A,
};

enum class DecodeError {
    MalformedHeader,
    UnknownKind,
    MalformedPayload,
};

std::string_view to_string(PacketKind kind) noexcept;
std::string_view to_string(DecodeError error) noexcept;

struct Header {
    PacketKind kind{PacketKind::Text};
    std::uint16_t payload_length{0};
};

// Header-level view: kind plus the opaque payload bytes.
struct Frame {
    PacketKind kind{PacketKind::Text};
    ByteBuffer payload;
};

struct TextPayload {
    std::string text;
};

struct FileStartPayload {
    std::string name;
    std::uint64_t total_size{0};
};

struct FileDataPayload {
    std::uint32_t sequence{0};
    integrity::Digest checksum{};
    ByteBuffer data;
};

struct FileEndPayload {};

struct DiscoveryRequestPayload {
    std::string username;
};

struct DiscoveryResponsePayload {
    std::string username;
};

struct AckPayload {
    std::uint32_t sequence{0};
};

struct NackPayload {
    std::uint32_t sequence{0};
};

struct FolderStartPayload {
    std::string path;
};

struct FolderEndPayload {};

using Packet = std::variant<TextPayload,
                            FileStartPayload,
                            FileDataPayload,
                            FileEndPayload,
                            DiscoveryRequestPayload,
                            DiscoveryResponsePayload,
                            AckPayload,
                            NackPayload,
                            FolderStartPayload,
                            FolderEndPayload>;

PacketKind kind_of(const Packet& packet) noexcept;

std::array<std::uint8_t, kHeaderSize> encode_header(const Header& header);
std::optional<Header> decode_header(std::span<const std::uint8_t> buffer);

// Throws std::length_error when the payload does not fit the 16-bit length field.
ByteBuffer encode_frame(PacketKind kind, std::span<const std::uint8_t> payload);
std::optional<Frame> decode_frame(std::span<const std::uint8_t> buffer, DecodeError* error = nullptr);

// Size of header plus declared payload, used to strip link-layer padding.
std::optional<std::size_t> framed_size(std::span<const std::uint8_t> buffer);

ByteBuffer encode(const Packet& packet);
std::optional<Packet> decode(std::span<const std::uint8_t> buffer, DecodeError* error = nullptr);

FileDataPayload make_file_data(std::uint32_t sequence, std::span<const std::uint8_t> data);

}  // namespace linkchat::protocol
