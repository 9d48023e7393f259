#pragma once

#include "quic_header.h"
#include <cstdint>
#include <cstddef>

namespace quicwire {
namespace quic {

/**
 * QUIC packet types.
 */
enum class PacketType : uint8_t {
    INITIAL,
    RETRY,
    HANDSHAKE,
    VERSION_NEGOTIATION,
    PROTECTED_0RTT,
    PROTECTED_1RTT,  // Short header packet
};

/**
 * QUIC transport error codes sent in CONNECTION_CLOSE.
 */
enum class TransportErrorCode : uint16_t {
    NO_ERROR = 0x0,
    INTERNAL_ERROR = 0x1,
    FLOW_CONTROL_ERROR = 0x3,
    STREAM_ID_ERROR = 0x4,
    STREAM_STATE_ERROR = 0x5,
    FINAL_OFFSET_ERROR = 0x6,
    FRAME_FORMAT_ERROR = 0x7,
    TRANSPORT_PARAMETER_ERROR = 0x8,
    VERSION_NEGOTIATION_ERROR = 0x9,
    PROTOCOL_VIOLATION = 0xa,
    UNSOLICITED_PONG = 0xb,
    FRAME_ERROR = 0x100,
};

/**
 * Determine the packet type of a parsed header.
 *
 * @param header Parsed header
 * @param validator Decides version negotiation
 * @return Packet type; unsupported_header_shape for an unknown long type
 */
result<PacketType> classify(const Header& header,
                            const VersionValidator& validator = DefaultVersionValidator::instance()) noexcept;

/**
 * Get string representation of packet type.
 */
const char* packet_type_to_string(PacketType type) noexcept;

/**
 * Check if packet type carries a packet number.
 */
bool packet_type_has_packet_number(PacketType type) noexcept;

/**
 * Transport error to close the connection with when a packet fails to
 * parse with err. Peers that send garbage get PROTOCOL_VIOLATION; local
 * failures are INTERNAL_ERROR.
 */
TransportErrorCode transport_error_for(core::error_code err) noexcept;

/**
 * Dump header in human-readable format for debugging.
 *
 * @param header Header to dump
 * @param buffer Output buffer
 * @param buffer_size Size of output buffer
 * @param validator Decides version negotiation for the type label; pass
 *        the one the header was parsed with
 * @return Number of characters that the full dump needs (snprintf semantics)
 */
int dump_header(const Header& header, char* buffer, size_t buffer_size,
                const VersionValidator& validator = DefaultVersionValidator::instance());

} // namespace quic
} // namespace quicwire
