// QUIC packet classification and diagnostics

#include "quic_packet.h"
#include <cstdio>

namespace quicwire {
namespace quic {

// ============================================================================
// Packet Type Helpers
// ============================================================================

result<PacketType> classify(const Header& header, const VersionValidator& validator) noexcept {
    const auto* long_hdr = std::get_if<LongHeader>(&header);
    if (!long_hdr) {
        return PacketType::PROTECTED_1RTT;
    }

    if (validator.is_version_negotiation(long_hdr->version)) {
        return PacketType::VERSION_NEGOTIATION;
    }

    switch (static_cast<LongHeaderType>(long_hdr->type)) {
        case LongHeaderType::INITIAL: return PacketType::INITIAL;
        case LongHeaderType::RETRY: return PacketType::RETRY;
        case LongHeaderType::HANDSHAKE: return PacketType::HANDSHAKE;
        case LongHeaderType::PROTECTED_0RTT: return PacketType::PROTECTED_0RTT;
    }
    return error_code::unsupported_header_shape;
}

const char* packet_type_to_string(PacketType type) noexcept {
    switch (type) {
        case PacketType::INITIAL: return "Initial";
        case PacketType::RETRY: return "Retry";
        case PacketType::HANDSHAKE: return "Handshake";
        case PacketType::VERSION_NEGOTIATION: return "VersionNegotiation";
        case PacketType::PROTECTED_0RTT: return "0-RTT";
        case PacketType::PROTECTED_1RTT: return "1-RTT";
        default: return "Unknown";
    }
}

bool packet_type_has_packet_number(PacketType type) noexcept {
    return type != PacketType::VERSION_NEGOTIATION;
}

TransportErrorCode transport_error_for(core::error_code err) noexcept {
    switch (err) {
        case error_code::success:
            return TransportErrorCode::NO_ERROR;
        case error_code::truncated_input:
        case error_code::invalid_field_length:
        case error_code::invalid_packet_number_width:
        case error_code::unsupported_header_shape:
        case error_code::protocol_violation:
            return TransportErrorCode::PROTOCOL_VIOLATION;
        case error_code::value_too_large:
        case error_code::internal_error:
            return TransportErrorCode::INTERNAL_ERROR;
    }
    return TransportErrorCode::INTERNAL_ERROR;
}

// ============================================================================
// Diagnostic Functions
// ============================================================================

int dump_header(const Header& header, char* buffer, size_t buffer_size,
                const VersionValidator& validator) {
    auto type = classify(header, validator);
    const char* type_name = type.is_ok() ? packet_type_to_string(type.value()) : "Unknown";

    if (const auto* long_hdr = std::get_if<LongHeader>(&header)) {
        return snprintf(buffer, buffer_size,
            "Long Header Packet:\n"
            "  Type: %s (0x%02X)\n"
            "  Version: 0x%08X\n"
            "  DCID: [%zu] %s\n"
            "  SCID: [%zu] %s\n"
            "  Payload Length: %s%llu\n"
            "  Packet Number: %s%llu\n"
            "  Header Bytes: %zu\n",
            type_name,
            long_hdr->type,
            long_hdr->version.value(),
            long_hdr->dest_conn_id.size(),
            long_hdr->dest_conn_id.to_hex().c_str(),
            long_hdr->source_conn_id.size(),
            long_hdr->source_conn_id.to_hex().c_str(),
            long_hdr->payload_length ? "" : "(none) ",
            static_cast<unsigned long long>(long_hdr->payload_length.value_or(0)),
            long_hdr->packet_number ? "" : "(none) ",
            static_cast<unsigned long long>(
                long_hdr->packet_number ? long_hdr->packet_number->value() : 0),
            long_hdr->raw.size()
        );
    }

    const auto& short_hdr = std::get<ShortHeader>(header);
    return snprintf(buffer, buffer_size,
        "Short Header Packet:\n"
        "  Type: %s\n"
        "  DCID: [%zu] %s\n"
        "  Packet Number: %llu\n"
        "  Packet Number Length: %u\n"
        "  Spin Bit: %d\n"
        "  Key Phase: %d\n"
        "  Reserved Bits: %d%d Demux: %d\n"
        "  Header Bytes: %zu\n",
        type_name,
        short_hdr.dest_conn_id.size(),
        short_hdr.dest_conn_id.to_hex().c_str(),
        static_cast<unsigned long long>(short_hdr.packet_number.value()),
        static_cast<unsigned>(short_hdr.packet_number.width()),
        short_hdr.spin_bit ? 1 : 0,
        short_hdr.key_phase ? 1 : 0,
        short_hdr.reserved_high ? 1 : 0,
        short_hdr.reserved_low ? 1 : 0,
        short_hdr.demux_bit ? 1 : 0,
        short_hdr.raw.size()
    );
}

} // namespace quic
} // namespace quicwire
