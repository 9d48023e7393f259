// QUIC long/short header parsing and serialization

#include "quic_header.h"
#include <cstdlib>
#include <cstring>

namespace quicwire {
namespace quic {

ParserConfig ParserConfig::from_env() noexcept {
    ParserConfig config;
    const char* strict = std::getenv("QUICWIRE_STRICT_SHORT_HEADER");
    if (strict && (std::strcmp(strict, "1") == 0 || std::strcmp(strict, "true") == 0)) {
        config.enforce_short_header_bits = true;
    }
    return config;
}

result<uint8_t> packet_number_width(uint8_t selector) noexcept {
    switch (static_cast<ShortHeaderType>(selector & ShortHeaderBits::TYPE_MASK)) {
        case ShortHeaderType::ONE_OCTET: return uint8_t{1};
        case ShortHeaderType::TWO_OCTET: return uint8_t{2};
        case ShortHeaderType::FOUR_OCTET: return uint8_t{4};
    }
    return error_code::invalid_packet_number_width;
}

result<ShortHeaderType> short_header_type_for_width(uint8_t width) noexcept {
    switch (width) {
        case 1: return ShortHeaderType::ONE_OCTET;
        case 2: return ShortHeaderType::TWO_OCTET;
        case 4: return ShortHeaderType::FOUR_OCTET;
        default: return error_code::invalid_packet_number_width;
    }
}

size_t LongHeader::serialized_size() const noexcept {
    size_t size = 0;
    size += 1;                          // Type
    size += Version::WIRE_SIZE;         // Version
    size += 1;                          // DCIL/SCIL
    size += dest_conn_id.size();
    size += source_conn_id.size();
    if (payload_length) {
        size += VarInt::encoded_size(*payload_length);
    }
    if (packet_number) {
        size += packet_number->size();
    }
    return size;
}

size_t ShortHeader::serialized_size() const noexcept {
    return 1 + 1 + dest_conn_id.size() + packet_number.size();
}

// ============================================================================
// Parsing
// ============================================================================

result<HeaderOffset> parse_header(const uint8_t* data, size_t len, size_t offset,
                                  const ParserConfig& config) {
    if (offset >= len) {
        return error_code::truncated_input;
    }

    if (is_long_header(data[offset])) {
        return parse_long_header(data, len, offset, config);
    }
    return parse_short_header(data, len, offset, config);
}

result<HeaderOffset> parse_long_header(const uint8_t* data, size_t len, size_t offset,
                                       const ParserConfig& config) {
    if (offset >= len) {
        return error_code::truncated_input;
    }

    const size_t start = offset;
    size_t pos = offset;

    uint8_t first_byte = data[pos++];
    if (!is_long_header(first_byte)) {
        return error_code::unsupported_header_shape;
    }

    LongHeader header;
    header.type = first_byte & 0x7F;

    if (len - pos < Version::WIRE_SIZE) {
        return error_code::truncated_input;
    }
    auto version = Version::from_bytes(data + pos, Version::WIRE_SIZE);
    if (version.is_err()) {
        return version.error();
    }
    header.version = version.value();
    pos += Version::WIRE_SIZE;

    // One byte carries both connection ID length classes
    if (pos >= len) {
        return error_code::truncated_input;
    }
    uint8_t lengths = data[pos++];
    size_t dcid_len = ConnectionID::length_from_class(lengths >> 4);
    size_t scid_len = ConnectionID::length_from_class(lengths & 0x0F);

    if (len - pos < dcid_len) {
        return error_code::truncated_input;
    }
    auto dcid = ConnectionID::from_bytes(data + pos, dcid_len);
    if (dcid.is_err()) {
        return dcid.error();
    }
    header.dest_conn_id = dcid.value();
    pos += dcid_len;

    if (len - pos < scid_len) {
        return error_code::truncated_input;
    }
    auto scid = ConnectionID::from_bytes(data + pos, scid_len);
    if (scid.is_err()) {
        return scid.error();
    }
    header.source_conn_id = scid.value();
    pos += scid_len;

    // Version negotiation has neither payload length nor packet number
    if (!config.validator().is_version_negotiation(header.version)) {
        auto payload_length = VarInt::decode(data, len, pos);
        if (payload_length.is_err()) {
            return payload_length.error();
        }
        header.payload_length = payload_length.value().value;
        pos = payload_length.value().offset;

        if (len - pos < 4) {
            return error_code::truncated_input;
        }
        auto pn = PacketNumber::from_bytes(data + pos, 4);
        if (pn.is_err()) {
            return pn.error();
        }
        header.packet_number = pn.value();
        pos += 4;
    }

    header.raw = std::span<const uint8_t>(data + start, pos - start);
    return HeaderOffset{Header(std::move(header)), pos};
}

result<HeaderOffset> parse_short_header(const uint8_t* data, size_t len, size_t offset,
                                        const ParserConfig& config) {
    if (offset >= len) {
        return error_code::truncated_input;
    }

    const size_t start = offset;
    size_t pos = offset;

    uint8_t first_byte = data[pos++];
    if (is_long_header(first_byte)) {
        return error_code::unsupported_header_shape;
    }

    ShortHeader header;
    header.key_phase = (first_byte & ShortHeaderBits::KEY_PHASE) != 0;
    header.reserved_high = (first_byte & ShortHeaderBits::RESERVED_HIGH) != 0;
    header.reserved_low = (first_byte & ShortHeaderBits::RESERVED_LOW) != 0;
    header.demux_bit = (first_byte & ShortHeaderBits::DEMUX) != 0;
    header.spin_bit = (first_byte & ShortHeaderBits::SPIN) != 0;

    if (config.enforce_short_header_bits &&
        (!header.reserved_high || !header.reserved_low || header.demux_bit)) {
        return error_code::protocol_violation;
    }

    if (pos >= len) {
        return error_code::truncated_input;
    }
    size_t dcid_len = data[pos++];
    if (len - pos < dcid_len) {
        return error_code::truncated_input;
    }
    auto dcid = ConnectionID::from_bytes(data + pos, dcid_len);
    if (dcid.is_err()) {
        return dcid.error();
    }
    header.dest_conn_id = dcid.value();
    pos += dcid_len;

    uint8_t selector = first_byte & ShortHeaderBits::TYPE_MASK;
    auto width = packet_number_width(selector);
    if (width.is_err()) {
        return width.error();
    }
    header.type = static_cast<ShortHeaderType>(selector);

    if (len - pos < width.value()) {
        return error_code::truncated_input;
    }
    auto pn = PacketNumber::from_bytes(data + pos, width.value());
    if (pn.is_err()) {
        return pn.error();
    }
    header.packet_number = pn.value();
    pos += width.value();

    header.raw = std::span<const uint8_t>(data + start, pos - start);
    return HeaderOffset{Header(std::move(header)), pos};
}

// ============================================================================
// Serialization
// ============================================================================

result<size_t> serialize_long_header(const LongHeader& header, uint8_t* out, size_t out_len,
                                     const ParserConfig& config) noexcept {
    if (header.type > 0x7F) {
        return error_code::invalid_field_length;
    }

    // Optional fields are present iff this is not version negotiation
    bool negotiation = config.validator().is_version_negotiation(header.version);
    if (negotiation) {
        if (header.payload_length || header.packet_number) {
            return error_code::invalid_field_length;
        }
    } else {
        if (!header.payload_length || !header.packet_number) {
            return error_code::invalid_field_length;
        }
        if (header.packet_number->width() != 4 || !header.packet_number->fits_width()) {
            return error_code::invalid_field_length;
        }
        if (*header.payload_length > VarInt::MAX_VALUE) {
            return error_code::value_too_large;
        }
    }

    size_t size = header.serialized_size();
    if (out_len < size) {
        return error_code::truncated_input;
    }

    size_t pos = 0;
    out[pos++] = static_cast<uint8_t>(0x80 | header.type);

    header.version.write(out + pos);
    pos += Version::WIRE_SIZE;

    out[pos++] = static_cast<uint8_t>((header.dest_conn_id.length_class() << 4) |
                                      header.source_conn_id.length_class());

    if (!header.dest_conn_id.empty()) {
        std::memcpy(out + pos, header.dest_conn_id.data(), header.dest_conn_id.size());
        pos += header.dest_conn_id.size();
    }
    if (!header.source_conn_id.empty()) {
        std::memcpy(out + pos, header.source_conn_id.data(), header.source_conn_id.size());
        pos += header.source_conn_id.size();
    }

    if (!negotiation) {
        auto written = VarInt::encode(*header.payload_length, out + pos, out_len - pos);
        if (written.is_err()) {
            return written.error();
        }
        pos += written.value();

        header.packet_number->write(out + pos);
        pos += header.packet_number->size();
    }

    return pos;
}

result<size_t> serialize_short_header(const ShortHeader& header, uint8_t* out,
                                      size_t out_len) noexcept {
    auto width = packet_number_width(static_cast<uint8_t>(header.type));
    if (width.is_err()) {
        return width.error();
    }
    if (header.packet_number.width() != width.value() || !header.packet_number.fits_width()) {
        return error_code::invalid_field_length;
    }

    size_t size = header.serialized_size();
    if (out_len < size) {
        return error_code::truncated_input;
    }

    uint8_t first = static_cast<uint8_t>(header.type) & ShortHeaderBits::TYPE_MASK;
    if (header.key_phase) first |= ShortHeaderBits::KEY_PHASE;
    if (header.reserved_high) first |= ShortHeaderBits::RESERVED_HIGH;
    if (header.reserved_low) first |= ShortHeaderBits::RESERVED_LOW;
    if (header.demux_bit) first |= ShortHeaderBits::DEMUX;
    if (header.spin_bit) first |= ShortHeaderBits::SPIN;

    size_t pos = 0;
    out[pos++] = first;

    out[pos++] = static_cast<uint8_t>(header.dest_conn_id.size());
    if (!header.dest_conn_id.empty()) {
        std::memcpy(out + pos, header.dest_conn_id.data(), header.dest_conn_id.size());
        pos += header.dest_conn_id.size();
    }

    header.packet_number.write(out + pos);
    pos += header.packet_number.size();

    return pos;
}

result<std::vector<uint8_t>> serialize_long_header(const LongHeader& header,
                                                   const ParserConfig& config) {
    std::vector<uint8_t> out(header.serialized_size());
    auto written = serialize_long_header(header, out.data(), out.size(), config);
    if (written.is_err()) {
        return written.error();
    }
    out.resize(written.value());
    return out;
}

result<std::vector<uint8_t>> serialize_short_header(const ShortHeader& header) {
    std::vector<uint8_t> out(header.serialized_size());
    auto written = serialize_short_header(header, out.data(), out.size());
    if (written.is_err()) {
        return written.error();
    }
    out.resize(written.value());
    return out;
}

result<std::vector<uint8_t>> serialize_header(const Header& header,
                                              const ParserConfig& config) {
    return std::visit([&config](const auto& h) -> result<std::vector<uint8_t>> {
        using T = std::decay_t<decltype(h)>;
        if constexpr (std::is_same_v<T, LongHeader>) {
            return serialize_long_header(h, config);
        } else {
            return serialize_short_header(h);
        }
    }, header);
}

} // namespace quic
} // namespace quicwire
