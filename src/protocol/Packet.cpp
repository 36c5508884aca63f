#include "linkchat/protocol/Packet.hpp"

#include <cstring>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace linkchat::protocol {

namespace {

void write_u16(ByteBuffer& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

std::uint16_t read_u16(const std::uint8_t* data) {
    return static_cast<std::uint16_t>((static_cast<std::uint16_t>(data[0]) << 8) | data[1]);
}

void write_u32(ByteBuffer& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

std::uint32_t read_u32(const std::uint8_t* data) {
    return (static_cast<std::uint32_t>(data[0]) << 24) |
           (static_cast<std::uint32_t>(data[1]) << 16) |
           (static_cast<std::uint32_t>(data[2]) << 8) |
           static_cast<std::uint32_t>(data[3]);
}

void write_u64(ByteBuffer& out, std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFu));
    }
}

std::uint64_t read_u64(const std::uint8_t* data) {
    std::uint64_t value = 0;
    for (int index = 0; index < 8; ++index) {
        value = (value << 8) | static_cast<std::uint64_t>(data[index]);
    }
    return value;
}

void write_string(ByteBuffer& out, const std::string& text) {
    out.insert(out.end(), text.begin(), text.end());
}

void write_prefixed_string(ByteBuffer& out, const std::string& text) {
    if (text.size() > 0xFFFFu) {
        throw std::length_error("string does not fit a 16-bit length prefix");
    }
    write_u16(out, static_cast<std::uint16_t>(text.size()));
    write_string(out, text);
}

bool is_known_kind(std::uint8_t value) {
    return value >= static_cast<std::uint8_t>(PacketKind::Text) &&
           value <= static_cast<std::uint8_t>(PacketKind::FolderEnd);
}

std::string read_string(std::span<const std::uint8_t> bytes) {
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

std::optional<std::string> read_prefixed_string(std::span<const std::uint8_t> payload, std::size_t& cursor) {
    if (payload.size() < cursor + 2) {
        return std::nullopt;
    }
    const auto length = read_u16(payload.data() + cursor);
    cursor += 2;
    if (payload.size() < cursor + length) {
        return std::nullopt;
    }
    auto text = read_string(payload.subspan(cursor, length));
    cursor += length;
    return text;
}

ByteBuffer encode_payload(const Packet& packet) {
    ByteBuffer out;
    std::visit(
        [&](const auto& payload) {
            using PayloadType = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<PayloadType, TextPayload>) {
                write_string(out, payload.text);
            } else if constexpr (std::is_same_v<PayloadType, FileStartPayload>) {
                out.reserve(2 + payload.name.size() + 8);
                write_prefixed_string(out, payload.name);
                write_u64(out, payload.total_size);
            } else if constexpr (std::is_same_v<PayloadType, FileDataPayload>) {
                out.reserve(kFileDataOverhead + payload.data.size());
                write_u32(out, payload.sequence);
                out.insert(out.end(), payload.checksum.begin(), payload.checksum.end());
                out.insert(out.end(), payload.data.begin(), payload.data.end());
            } else if constexpr (std::is_same_v<PayloadType, DiscoveryRequestPayload> ||
                                 std::is_same_v<PayloadType, DiscoveryResponsePayload>) {
                write_string(out, payload.username);
            } else if constexpr (std::is_same_v<PayloadType, AckPayload> ||
                                 std::is_same_v<PayloadType, NackPayload>) {
                write_u32(out, payload.sequence);
            } else if constexpr (std::is_same_v<PayloadType, FolderStartPayload>) {
                write_prefixed_string(out, payload.path);
            }
            // FileEnd and FolderEnd carry no payload.
        },
        packet);
    return out;
}

std::optional<Packet> decode_payload(PacketKind kind, std::span<const std::uint8_t> payload) {
    switch (kind) {
        case PacketKind::Text:
            return Packet{TextPayload{read_string(payload)}};
        case PacketKind::FileStart: {
            std::size_t cursor = 0;
            auto name = read_prefixed_string(payload, cursor);
            if (!name.has_value() || payload.size() != cursor + 8) {
                return std::nullopt;
            }
            FileStartPayload start{};
            start.name = std::move(*name);
            start.total_size = read_u64(payload.data() + cursor);
            return Packet{std::move(start)};
        }
        case PacketKind::FileData: {
            if (payload.size() < kFileDataOverhead) {
                return std::nullopt;
            }
            FileDataPayload data{};
            data.sequence = read_u32(payload.data());
            std::memcpy(data.checksum.data(), payload.data() + kSequenceSize, data.checksum.size());
            data.data.assign(payload.begin() + kFileDataOverhead, payload.end());
            return Packet{std::move(data)};
        }
        case PacketKind::FileEnd:
            if (!payload.empty()) {
                return std::nullopt;
            }
            return Packet{FileEndPayload{}};
        case PacketKind::DiscoveryRequest:
            return Packet{DiscoveryRequestPayload{read_string(payload)}};
        case PacketKind::DiscoveryResponse:
            return Packet{DiscoveryResponsePayload{read_string(payload)}};
        case PacketKind::Ack:
            if (payload.size() != kSequenceSize) {
                return std::nullopt;
            }
            return Packet{AckPayload{read_u32(payload.data())}};
        case PacketKind::Nack:
            if (payload.size() != kSequenceSize) {
                return std::nullopt;
            }
            return Packet{NackPayload{read_u32(payload.data())}};
        case PacketKind::FolderStart: {
            std::size_t cursor = 0;
            auto path = read_prefixed_string(payload, cursor);
            if (!path.has_value() || cursor != payload.size()) {
                return std::nullopt;
            }
            return Packet{FolderStartPayload{std::move(*path)}};
        }
        case PacketKind::FolderEnd:
            if (!payload.empty()) {
                return std::nullopt;
            }
            return Packet{FolderEndPayload{}};
    }
    return std::nullopt;
}

void set_error(DecodeError* slot, DecodeError error) {
    if (slot != nullptr) {
        *slot = error;
    }
}

}  // namespace

std::string_view to_string(PacketKind kind) noexcept {
    switch (kind) {
        case PacketKind::Text:
            return "TEXT";
        case PacketKind::FileStart:
            return "FILE_START";
        case PacketKind::FileData:
            return "FILE_DATA";
        case PacketKind::FileEnd:
            return "FILE_END";
        case PacketKind::DiscoveryRequest:
            return "DISCOVERY_REQUEST";
        case PacketKind::DiscoveryResponse:
            return "DISCOVERY_RESPONSE";
        case PacketKind::Ack:
            return "ACK";
        case PacketKind::Nack:
            return "NACK";
        case PacketKind::FolderStart:
            return "FOLDER_START";
        case PacketKind::FolderEnd:
            return "FOLDER_END";
    }
    return "UNKNOWN";
}

std::string_view to_string(DecodeError error) noexcept {
    switch (error) {
        case DecodeError::MalformedHeader:
            return "malformed_header";
        case DecodeError::UnknownKind:
            return "unknown_kind";
        case DecodeError::MalformedPayload:
            return "malformed_payload";
    }
    return "unknown";
}

PacketKind kind_of(const Packet& packet) noexcept {
    // Variant alternatives are declared in wire-code order.
    return static_cast<PacketKind>(packet.index() + 1);
}

std::array<std::uint8_t, kHeaderSize> encode_header(const Header& header) {
    return {static_cast<std::uint8_t>(header.kind),
            static_cast<std::uint8_t>((header.payload_length >> 8) & 0xFFu),
            static_cast<std::uint8_t>(header.payload_length & 0xFFu)};
}

std::optional<Header> decode_header(std::span<const std::uint8_t> buffer) {
    if (buffer.size() < kHeaderSize || !is_known_kind(buffer[0])) {
        return std::nullopt;
    }
    Header header{};
    header.kind = static_cast<PacketKind>(buffer[0]);
    header.payload_length = read_u16(buffer.data() + 1);
    return header;
}

ByteBuffer encode_frame(PacketKind kind, std::span<const std::uint8_t> payload) {
    if (payload.size() > kMaxPayloadSize) {
        throw std::length_error("payload exceeds 65535 bytes");
    }
    Header header{};
    header.kind = kind;
    header.payload_length = static_cast<std::uint16_t>(payload.size());
    const auto header_bytes = encode_header(header);

    ByteBuffer out;
    out.reserve(kHeaderSize + payload.size());
    out.insert(out.end(), header_bytes.begin(), header_bytes.end());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

std::optional<Frame> decode_frame(std::span<const std::uint8_t> buffer, DecodeError* error) {
    if (buffer.size() < kHeaderSize) {
        set_error(error, DecodeError::MalformedHeader);
        return std::nullopt;
    }
    if (!is_known_kind(buffer[0])) {
        set_error(error, DecodeError::UnknownKind);
        return std::nullopt;
    }
    const auto declared = read_u16(buffer.data() + 1);
    if (buffer.size() - kHeaderSize != declared) {
        set_error(error, DecodeError::MalformedHeader);
        return std::nullopt;
    }

    Frame frame{};
    frame.kind = static_cast<PacketKind>(buffer[0]);
    frame.payload.assign(buffer.begin() + kHeaderSize, buffer.end());
    return frame;
}

std::optional<std::size_t> framed_size(std::span<const std::uint8_t> buffer) {
    if (buffer.size() < kHeaderSize) {
        return std::nullopt;
    }
    const auto total = kHeaderSize + read_u16(buffer.data() + 1);
    if (total > buffer.size()) {
        return std::nullopt;
    }
    return total;
}

ByteBuffer encode(const Packet& packet) {
    const auto payload = encode_payload(packet);
    return encode_frame(kind_of(packet), payload);
}

std::optional<Packet> decode(std::span<const std::uint8_t> buffer, DecodeError* error) {
    const auto frame = decode_frame(buffer, error);
    if (!frame.has_value()) {
        return std::nullopt;
    }
    auto packet = decode_payload(frame->kind, frame->payload);
    if (!packet.has_value()) {
        set_error(error, DecodeError::MalformedPayload);
    }
    return packet;
}

FileDataPayload make_file_data(std::uint32_t sequence, std::span<const std::uint8_t> data) {
    FileDataPayload payload{};
    payload.sequence = sequence;
    payload.checksum = integrity::checksum(data);
    payload.data.assign(data.begin(), data.end());
    return payload;
}

}  // namespace linkchat::protocol
