// QUIC wire value types: connection IDs, versions, packet numbers

#include "quic_types.h"
#include <openssl/rand.h>

namespace quicwire {
namespace quic {

// ============================================================================
// ConnectionID
// ============================================================================

result<ConnectionID> ConnectionID::from_bytes(const uint8_t* bytes, size_t len) noexcept {
    if (!is_valid_length(len)) {
        return error_code::invalid_field_length;
    }

    ConnectionID cid;
    if (len > 0) {
        std::memcpy(cid.data_, bytes, len);
    }
    cid.length_ = static_cast<uint8_t>(len);
    return cid;
}

result<ConnectionID> ConnectionID::random(size_t len) noexcept {
    if (!is_valid_length(len)) {
        return error_code::invalid_field_length;
    }

    ConnectionID cid;
    cid.length_ = static_cast<uint8_t>(len);
    if (len > 0 && RAND_bytes(cid.data_, static_cast<int>(len)) != 1) {
        return error_code::internal_error;
    }
    return cid;
}

std::string ConnectionID::to_hex() const {
    static constexpr char digits[] = "0123456789abcdef";

    std::string out;
    out.reserve(length_ * 2);
    for (uint8_t i = 0; i < length_; i++) {
        out.push_back(digits[data_[i] >> 4]);
        out.push_back(digits[data_[i] & 0x0F]);
    }
    return out;
}

// ============================================================================
// Version
// ============================================================================

result<Version> Version::from_bytes(const uint8_t* bytes, size_t len) noexcept {
    if (len != WIRE_SIZE) {
        return error_code::invalid_field_length;
    }

    uint32_t value = (static_cast<uint32_t>(bytes[0]) << 24) |
                     (static_cast<uint32_t>(bytes[1]) << 16) |
                     (static_cast<uint32_t>(bytes[2]) << 8) |
                     static_cast<uint32_t>(bytes[3]);
    return Version(value);
}

// ============================================================================
// PacketNumber
// ============================================================================

result<PacketNumber> PacketNumber::create(uint64_t value, uint8_t width) noexcept {
    if (!is_valid_width(width) || value > MAX_VALUE) {
        return error_code::invalid_field_length;
    }
    return PacketNumber(value, width);
}

result<PacketNumber> PacketNumber::from_bytes(const uint8_t* bytes, size_t len) noexcept {
    if (!is_valid_width(len)) {
        return error_code::invalid_field_length;
    }

    uint64_t value = 0;
    for (size_t i = 0; i < len; i++) {
        value = (value << 8) | bytes[i];
    }
    return PacketNumber(value, static_cast<uint8_t>(len));
}

// ============================================================================
// Packet Number Encoding/Decoding Helpers
// ============================================================================

/**
 * The peer must be able to tell full_pn apart from every packet it may
 * still be waiting on, so the encoding has to cover twice the number of
 * unacknowledged packets. Three-byte encodings do not exist in this header
 * format and round up to four.
 */
uint8_t truncated_packet_number_width(uint64_t full_pn,
                                      std::optional<uint64_t> largest_acked) noexcept {
    uint64_t num_unacked;
    if (!largest_acked) {
        num_unacked = full_pn + 1;
    } else {
        num_unacked = full_pn > *largest_acked ? full_pn - *largest_acked : 1;
    }
    uint64_t range = num_unacked * 2;

    if (range < 0x100) return 1;
    if (range < 0x10000) return 2;
    return 4;
}

uint64_t decode_packet_number(uint64_t truncated_pn,
                              uint64_t largest_pn,
                              uint8_t pn_nbits) noexcept {
    if (pn_nbits != 8 && pn_nbits != 16 && pn_nbits != 32) {
        return truncated_pn;
    }

    uint64_t expected_pn = largest_pn + 1;
    uint64_t pn_win = 1ULL << pn_nbits;
    uint64_t pn_hwin = pn_win / 2;
    uint64_t pn_mask = pn_win - 1;

    // Replace the low bits of the expected packet number, then move one
    // window up or down if that lands outside [expected - hwin, expected + hwin].
    uint64_t candidate_pn = (expected_pn & ~pn_mask) | (truncated_pn & pn_mask);

    if (expected_pn > pn_hwin &&
        candidate_pn <= expected_pn - pn_hwin &&
        candidate_pn < (1ULL << 62) - pn_win) {
        return candidate_pn + pn_win;
    }

    if (candidate_pn > expected_pn + pn_hwin && candidate_pn >= pn_win) {
        return candidate_pn - pn_win;
    }

    return candidate_pn;
}

} // namespace quic
} // namespace quicwire
