#include "linkchat/transfer/Transfer.hpp"

#include <sstream>

namespace linkchat::transfer {

std::string_view to_string(TransferError error) noexcept {
    switch (error) {
        case TransferError::AckTimeout:
            return "ack_timeout";
        case TransferError::NegativeAcknowledged:
            return "negative_acknowledged";
        case TransferError::RetryCeilingExceeded:
            return "retry_ceiling_exceeded";
        case TransferError::TransportUnavailable:
            return "transport_unavailable";
        case TransferError::PeerBusy:
            return "peer_busy";
        case TransferError::Cancelled:
            return "cancelled";
        case TransferError::InvalidArgument:
            return "invalid_argument";
    }
    return "unknown";
}

std::string TransferFailure::describe() const {
    std::ostringstream oss;
    oss << "transfer of '" << name << "' to " << mac_to_string(peer) << " failed: " << to_string(error);
    if (failed_sequence.has_value()) {
        oss << " at fragment " << *failed_sequence;
    }
    if (attempts > 0) {
        oss << " after " << attempts << " attempt" << (attempts == 1 ? "" : "s");
    }
    if (last_cause.has_value()) {
        oss << " (last: " << to_string(*last_cause) << ")";
    }
    if (last_acked_sequence.has_value()) {
        oss << ", last acknowledged fragment " << *last_acked_sequence;
    } else {
        oss << ", no fragment acknowledged";
    }
    if (!detail.empty()) {
        oss << ": " << detail;
    }
    return oss.str();
}

}  // namespace linkchat::transfer
