#pragma once

#include "quic_types.h"
#include "quic_varint.h"
#include "quic_version.h"
#include <cstdint>
#include <cstddef>
#include <optional>
#include <span>
#include <variant>
#include <vector>

namespace quicwire {
namespace quic {

/**
 * Long header packet types (7-bit type field, MSB of the byte is 1).
 */
enum class LongHeaderType : uint8_t {
    INITIAL = 0x7F,
    RETRY = 0x7E,
    HANDSHAKE = 0x7D,
    PROTECTED_0RTT = 0x7C,
};

/**
 * Short header packet-number width selector (low 2 bits of the first byte).
 *
 * Selector 3 has no width assigned and is rejected.
 */
enum class ShortHeaderType : uint8_t {
    ONE_OCTET = 0x00,
    TWO_OCTET = 0x01,
    FOUR_OCTET = 0x02,
};

/**
 * Bits of the short header first byte.
 */
namespace ShortHeaderBits {
    constexpr uint8_t LONG_FORM     = 0x80;  // Always 0 for short headers
    constexpr uint8_t KEY_PHASE     = 0x40;
    constexpr uint8_t RESERVED_HIGH = 0x20;  // Expected 1
    constexpr uint8_t RESERVED_LOW  = 0x10;  // Expected 1
    constexpr uint8_t DEMUX         = 0x08;  // Expected 0 (gQUIC demultiplexing)
    constexpr uint8_t SPIN          = 0x04;
    constexpr uint8_t TYPE_MASK     = 0x03;
}

/**
 * Header parsing options.
 */
struct ParserConfig {
    // Reject short headers whose reserved bits are not 1,1 or whose demux
    // bit is set (protocol_violation). Off: the bits are exposed unchecked.
    bool enforce_short_header_bits = false;

    // Decides the version-negotiation shape. nullptr selects
    // DefaultVersionValidator.
    const VersionValidator* version_validator = nullptr;

    const VersionValidator& validator() const noexcept {
        return version_validator ? *version_validator : DefaultVersionValidator::instance();
    }

    /**
     * Defaults, with QUICWIRE_STRICT_SHORT_HEADER=1 turning on
     * enforce_short_header_bits.
     */
    static ParserConfig from_env() noexcept;
};

/**
 * QUIC long header.
 *
 * Format:
 * +-+-+-+-+-+-+-+-+
 * |1|   Type (7)  |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |                         Version (32)                          |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |DCIL(4)|SCIL(4)|
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |               Destination Connection ID (0/32..144)         ...
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |                 Source Connection ID (0/32..144)            ...
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |                       Payload Length (i)                    ...
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |                       Packet Number (32)                      |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 *
 * Version negotiation headers end after the Source Connection ID; the
 * supported-versions list that follows is not part of the header.
 */
struct LongHeader {
    uint8_t type = static_cast<uint8_t>(LongHeaderType::INITIAL);
    Version version;
    ConnectionID dest_conn_id;
    ConnectionID source_conn_id;
    std::optional<uint64_t> payload_length;       // Absent for version negotiation
    std::optional<PacketNumber> packet_number;    // Absent for version negotiation

    // Header bytes as received (AEAD associated data). Points into the
    // parsed buffer; empty for headers built locally.
    std::span<const uint8_t> raw;

    /**
     * Bytes serialize_long_header() will produce for the present fields.
     */
    size_t serialized_size() const noexcept;

    // Compares wire fields; raw is ignored.
    bool operator==(const LongHeader& other) const noexcept {
        return type == other.type &&
               version == other.version &&
               dest_conn_id == other.dest_conn_id &&
               source_conn_id == other.source_conn_id &&
               payload_length == other.payload_length &&
               packet_number == other.packet_number;
    }

    bool operator!=(const LongHeader& other) const noexcept {
        return !(*this == other);
    }
};

/**
 * QUIC short header.
 *
 * Format:
 * +-+-+-+-+-+-+-+-+
 * |0|K|1|1|0|S|T T|
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * | DCID Len (8)  |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |                Destination Connection ID (0/32..144)        ...
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |                      Packet Number (8/16/32)                ...
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 *
 * The short header does not describe its connection ID length. The DCID
 * Len byte is our own convention: we issue the connection IDs peers put
 * here, so we are free to prefix them with their length. Other
 * implementations will not produce it.
 */
struct ShortHeader {
    ShortHeaderType type = ShortHeaderType::FOUR_OCTET;
    bool key_phase = false;
    bool spin_bit = false;
    bool reserved_high = true;
    bool reserved_low = true;
    bool demux_bit = false;
    ConnectionID dest_conn_id;
    PacketNumber packet_number;

    std::span<const uint8_t> raw;

    size_t serialized_size() const noexcept;

    bool operator==(const ShortHeader& other) const noexcept {
        return type == other.type &&
               key_phase == other.key_phase &&
               spin_bit == other.spin_bit &&
               reserved_high == other.reserved_high &&
               reserved_low == other.reserved_low &&
               demux_bit == other.demux_bit &&
               dest_conn_id == other.dest_conn_id &&
               packet_number == other.packet_number;
    }

    bool operator!=(const ShortHeader& other) const noexcept {
        return !(*this == other);
    }
};

using Header = std::variant<LongHeader, ShortHeader>;

/**
 * A parsed header and the absolute offset of its first payload byte.
 */
struct HeaderOffset {
    Header header;
    size_t offset;
};

inline bool is_long_header(uint8_t first_byte) noexcept {
    return (first_byte & 0x80) != 0;
}

/**
 * Raw header bytes of either variant.
 */
inline std::span<const uint8_t> raw_header_bytes(const Header& header) noexcept {
    return std::visit([](const auto& h) { return h.raw; }, header);
}

/**
 * Packet number width for a short header selector.
 *
 * @return 1, 2 or 4; invalid_packet_number_width for selector 3
 */
result<uint8_t> packet_number_width(uint8_t selector) noexcept;

/**
 * Short header selector for a packet number width.
 *
 * @return invalid_packet_number_width unless width is 1, 2 or 4
 */
result<ShortHeaderType> short_header_type_for_width(uint8_t width) noexcept;

// ============================================================================
// Parsing
// ============================================================================

/**
 * Parse one header starting at offset.
 *
 * Dispatches on bit 7 of the first byte. On success the returned offset is
 * the first payload byte and the header's raw span covers
 * [offset, returned offset).
 *
 * @param data Datagram buffer (must outlive the returned header's raw span)
 * @param len Datagram length
 * @param offset Start of the packet
 * @param config Parser options
 */
result<HeaderOffset> parse_header(const uint8_t* data, size_t len, size_t offset,
                                  const ParserConfig& config = {});

result<HeaderOffset> parse_long_header(const uint8_t* data, size_t len, size_t offset,
                                       const ParserConfig& config = {});

result<HeaderOffset> parse_short_header(const uint8_t* data, size_t len, size_t offset,
                                        const ParserConfig& config = {});

// ============================================================================
// Serialization
// ============================================================================

/**
 * Serialize a long header into a caller buffer.
 *
 * @return Bytes written; invalid_field_length if the optional fields do
 *         not match the version shape, the type exceeds 7 bits or the
 *         packet number does not fit 4 bytes,
 *         value_too_large for an unencodable payload length,
 *         truncated_input if out_len is too small
 */
result<size_t> serialize_long_header(const LongHeader& header, uint8_t* out, size_t out_len,
                                     const ParserConfig& config = {}) noexcept;

/**
 * Serialize a short header into a caller buffer.
 *
 * @return Bytes written; invalid_field_length if the packet number width
 *         does not match the selector or the value does not fit it,
 *         truncated_input if out_len is too small
 */
result<size_t> serialize_short_header(const ShortHeader& header, uint8_t* out,
                                      size_t out_len) noexcept;

result<std::vector<uint8_t>> serialize_long_header(const LongHeader& header,
                                                   const ParserConfig& config = {});

result<std::vector<uint8_t>> serialize_short_header(const ShortHeader& header);

/**
 * Serialize either variant.
 */
result<std::vector<uint8_t>> serialize_header(const Header& header,
                                              const ParserConfig& config = {});

} // namespace quic
} // namespace quicwire
