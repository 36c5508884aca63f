#pragma once

#include "linkchat/Types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace linkchat::transfer {

enum class TransferError {
    AckTimeout,
    NegativeAcknowledged,
    RetryCeilingExceeded,
    TransportUnavailable,
    PeerBusy,
    Cancelled,
    InvalidArgument,
};

std::string_view to_string(TransferError error) noexcept;

struct TransferReport {
    MacAddress peer{};
    std::string name;
    std::uint64_t byte_count{0};
    std::uint32_t fragment_count{0};
    std::uint32_t transmissions{0};
    std::uint32_t retransmissions{0};
    std::uint32_t timeouts{0};
    std::uint32_t nacks{0};
    std::chrono::milliseconds elapsed{0};
};

struct TransferFailure {
    MacAddress peer{};
    std::string name;
    TransferError error{TransferError::TransportUnavailable};
    // Recoverable condition that preceded a RetryCeilingExceeded abort.
    std::optional<TransferError> last_cause;
    std::optional<std::uint32_t> failed_sequence;
    std::optional<std::uint32_t> last_acked_sequence;
    std::uint32_t attempts{0};
    std::string detail;

    std::string describe() const;
};

using TransferResult = std::variant<TransferReport, TransferFailure>;

inline bool succeeded(const TransferResult& result) noexcept {
    return std::holds_alternative<TransferReport>(result);
}

struct TransferProgress {
    MacAddress peer{};
    std::string name;
    std::uint64_t bytes_acked{0};
    std::uint64_t total_bytes{0};
    std::uint32_t fragments_acked{0};
    std::uint32_t fragment_count{0};
};

struct ReceiveReport {
    MacAddress peer{};
    std::string name;
    std::uint64_t expected_size{0};
    std::uint64_t bytes_received{0};
    std::uint32_t fragments{0};
    std::uint32_t duplicates{0};
    std::uint32_t corrupt{0};
    bool complete{false};
    bool failed{false};
};

}  // namespace linkchat::transfer
