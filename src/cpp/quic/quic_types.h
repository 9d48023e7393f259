#pragma once

#include "../core/result.h"
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <optional>
#include <string>

namespace quicwire {
namespace quic {

using core::result;
using core::error_code;

/**
 * QUIC connection ID.
 *
 * Length is 0 or 4..18 bytes. Long headers carry the length as a 4-bit
 * class: 0 means empty, any other class n means n + 3 bytes.
 *
 * Stored inline; copying a ConnectionID never touches the datagram it
 * was parsed from.
 */
class ConnectionID {
public:
    static constexpr size_t MIN_LENGTH = 4;
    static constexpr size_t MAX_LENGTH = 18;

    ConnectionID() noexcept : length_(0) {
        std::memset(data_, 0, sizeof(data_));
    }

    /**
     * Build from raw bytes.
     *
     * @return invalid_field_length unless len is 0 or 4..18
     */
    static result<ConnectionID> from_bytes(const uint8_t* bytes, size_t len) noexcept;

    /**
     * Generate a connection ID from the OpenSSL CSPRNG.
     *
     * @return invalid_field_length for a bad length, internal_error if the
     *         RNG fails
     */
    static result<ConnectionID> random(size_t len) noexcept;

    static constexpr bool is_valid_length(size_t len) noexcept {
        return len == 0 || (len >= MIN_LENGTH && len <= MAX_LENGTH);
    }

    /**
     * Decode a 4-bit length class.
     */
    static constexpr size_t length_from_class(uint8_t nibble) noexcept {
        nibble &= 0x0F;
        return nibble == 0 ? 0 : static_cast<size_t>(nibble) + 3;
    }

    /**
     * 4-bit length class of this ID (0 for an empty ID).
     */
    uint8_t length_class() const noexcept {
        return length_ == 0 ? 0 : static_cast<uint8_t>(length_ - 3);
    }

    const uint8_t* data() const noexcept { return data_; }
    size_t size() const noexcept { return length_; }
    bool empty() const noexcept { return length_ == 0; }

    /**
     * Lowercase hex rendering, "" for an empty ID.
     */
    std::string to_hex() const;

    bool operator==(const ConnectionID& other) const noexcept {
        return length_ == other.length_ &&
               std::memcmp(data_, other.data_, length_) == 0;
    }

    bool operator!=(const ConnectionID& other) const noexcept {
        return !(*this == other);
    }

    /**
     * Shorter IDs order first, then bytewise.
     */
    bool operator<(const ConnectionID& other) const noexcept {
        if (length_ != other.length_) {
            return length_ < other.length_;
        }
        return std::memcmp(data_, other.data_, length_) < 0;
    }

private:
    uint8_t data_[MAX_LENGTH];
    uint8_t length_;
};

/**
 * QUIC version (4 bytes, big-endian on the wire).
 */
class Version {
public:
    static constexpr size_t WIRE_SIZE = 4;
    static constexpr uint32_t NEGOTIATION = 0x00000000;

    Version() noexcept : value_(0) {}
    explicit Version(uint32_t value) noexcept : value_(value) {}

    /**
     * Build from raw bytes.
     *
     * @return invalid_field_length unless len == 4
     */
    static result<Version> from_bytes(const uint8_t* bytes, size_t len) noexcept;

    uint32_t value() const noexcept { return value_; }
    size_t size() const noexcept { return WIRE_SIZE; }

    /**
     * Write the 4 big-endian bytes to out.
     */
    void write(uint8_t* out) const noexcept {
        out[0] = static_cast<uint8_t>((value_ >> 24) & 0xFF);
        out[1] = static_cast<uint8_t>((value_ >> 16) & 0xFF);
        out[2] = static_cast<uint8_t>((value_ >> 8) & 0xFF);
        out[3] = static_cast<uint8_t>(value_ & 0xFF);
    }

    bool operator==(const Version& other) const noexcept { return value_ == other.value_; }
    bool operator!=(const Version& other) const noexcept { return value_ != other.value_; }

private:
    uint32_t value_;
};

/**
 * QUIC packet number.
 *
 * The value is the full packet number (up to 2^62 - 1); the width is the
 * number of bytes it occupies on the wire (1, 2 or 4). Arithmetic works on
 * the full value and keeps the width; write() emits the low width bytes.
 */
class PacketNumber {
public:
    static constexpr uint64_t MAX_VALUE = (1ULL << 62) - 1;

    PacketNumber() noexcept : value_(0), width_(4) {}

    /**
     * @return invalid_field_length unless width is 1, 2 or 4 and value
     *         fits in 62 bits
     */
    static result<PacketNumber> create(uint64_t value, uint8_t width) noexcept;

    /**
     * Read a big-endian packet number of len bytes.
     *
     * @return invalid_field_length unless len is 1, 2 or 4
     */
    static result<PacketNumber> from_bytes(const uint8_t* bytes, size_t len) noexcept;

    static constexpr bool is_valid_width(size_t width) noexcept {
        return width == 1 || width == 2 || width == 4;
    }

    uint64_t value() const noexcept { return value_; }
    uint8_t width() const noexcept { return width_; }
    size_t size() const noexcept { return width_; }

    /**
     * True if value() survives write() unchanged. Serializers require it;
     * a full packet number must be truncated by the caller first.
     */
    bool fits_width() const noexcept {
        return width_ >= 8 || (value_ >> (8 * width_)) == 0;
    }

    /**
     * Write the low width() bytes, big-endian.
     */
    void write(uint8_t* out) const noexcept {
        for (uint8_t i = 0; i < width_; i++) {
            out[i] = static_cast<uint8_t>((value_ >> (8 * (width_ - 1 - i))) & 0xFF);
        }
    }

    PacketNumber next() const noexcept { return *this + 1; }

    PacketNumber operator+(uint64_t n) const noexcept {
        PacketNumber pn = *this;
        pn.value_ = (value_ + n) & MAX_VALUE;
        return pn;
    }

    /**
     * Distance between two packet numbers (this - other, modulo 2^62).
     */
    uint64_t operator-(const PacketNumber& other) const noexcept {
        return (value_ - other.value_) & MAX_VALUE;
    }

    bool operator==(const PacketNumber& other) const noexcept {
        return value_ == other.value_ && width_ == other.width_;
    }
    bool operator!=(const PacketNumber& other) const noexcept { return !(*this == other); }

    // Ordering ignores the wire width.
    bool operator<(const PacketNumber& other) const noexcept { return value_ < other.value_; }
    bool operator>(const PacketNumber& other) const noexcept { return value_ > other.value_; }
    bool operator<=(const PacketNumber& other) const noexcept { return value_ <= other.value_; }
    bool operator>=(const PacketNumber& other) const noexcept { return value_ >= other.value_; }

private:
    PacketNumber(uint64_t value, uint8_t width) noexcept : value_(value), width_(width) {}

    uint64_t value_;
    uint8_t width_;
};

// ============================================================================
// Packet number helpers for the ACK / loss-detection layer
// ============================================================================

/**
 * Smallest short-header width (1, 2 or 4) able to carry full_pn so that a
 * peer whose largest acknowledged packet is largest_acked can rebuild it.
 *
 * @param largest_acked std::nullopt when nothing has been acknowledged yet;
 *        every packet up to and including full_pn then counts as unacked
 */
uint8_t truncated_packet_number_width(uint64_t full_pn,
                                      std::optional<uint64_t> largest_acked) noexcept;

/**
 * Rebuild a full packet number from its truncated wire form
 * (RFC 9000 Appendix A.3).
 *
 * @param truncated_pn Packet number as read from the wire
 * @param largest_pn Largest packet number successfully processed so far
 * @param pn_nbits Bits on the wire (8, 16 or 32); any other value returns
 *        truncated_pn unchanged
 */
uint64_t decode_packet_number(uint64_t truncated_pn,
                              uint64_t largest_pn,
                              uint8_t pn_nbits) noexcept;

} // namespace quic
} // namespace quicwire
