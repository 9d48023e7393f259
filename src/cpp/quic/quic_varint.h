#pragma once

#include "../core/result.h"
#include <cstdint>
#include <cstddef>
#include <vector>

namespace quicwire {
namespace quic {

using core::result;
using core::error_code;

/**
 * Decoded varint plus the offset of the first byte after it.
 */
struct VarIntOffset {
    uint64_t value;
    size_t offset;
};

/**
 * QUIC Variable-Length Integer Encoding (VLIE).
 *
 * The two most significant bits of the first byte select the length:
 *   00 = 1 byte  (0-63)
 *   01 = 2 bytes (0-16383)
 *   10 = 4 bytes (0-1073741823)
 *   11 = 8 bytes (0-4611686018427387903)
 *
 * Encoding always picks the shortest form. Decoding accepts any form,
 * so a non-canonical peer encoding decodes fine but does not re-encode
 * to the same bytes.
 */
class VarInt {
public:
    static constexpr uint64_t MAX_1_BYTE = 63;
    static constexpr uint64_t MAX_2_BYTE = 16383;
    static constexpr uint64_t MAX_4_BYTE = 1073741823;
    static constexpr uint64_t MAX_VALUE = 4611686018427387903ULL;  // 2^62 - 1
    static constexpr size_t MAX_ENCODED_SIZE = 8;

    /**
     * Encode variable-length integer into a caller buffer.
     *
     * @param value Value to encode
     * @param out Output buffer
     * @param out_len Output buffer capacity
     * @return Number of bytes written (1, 2, 4, or 8), value_too_large
     *         above MAX_VALUE, truncated_input if out_len is too small
     */
    static result<size_t> encode(uint64_t value, uint8_t* out, size_t out_len) noexcept {
        size_t bytes = encoded_size(value);
        if (bytes == 0) {
            return error_code::value_too_large;
        }
        if (out_len < bytes) {
            return error_code::truncated_input;
        }

        for (size_t i = 0; i < bytes; i++) {
            out[i] = static_cast<uint8_t>((value >> (8 * (bytes - 1 - i))) & 0xFF);
        }
        out[0] |= length_prefix(bytes);
        return bytes;
    }

    /**
     * Encode variable-length integer into a fresh byte vector.
     */
    static result<std::vector<uint8_t>> encode(uint64_t value) {
        size_t bytes = encoded_size(value);
        if (bytes == 0) {
            return error_code::value_too_large;
        }
        std::vector<uint8_t> out(bytes);
        auto written = encode(value, out.data(), out.size());
        if (written.is_err()) {
            return written.error();
        }
        return out;
    }

    /**
     * Decode variable-length integer at an offset.
     *
     * @param data Input buffer
     * @param len Buffer length
     * @param offset Offset of the first varint byte
     * @return Value and offset after the varint, or truncated_input if the
     *         length announced by the prefix runs past len
     */
    static result<VarIntOffset> decode(const uint8_t* data, size_t len, size_t offset) noexcept {
        if (offset >= len) {
            return error_code::truncated_input;
        }

        uint8_t prefix = data[offset] >> 6;
        size_t bytes = size_t{1} << prefix;

        if (len - offset < bytes) {
            return error_code::truncated_input;
        }

        uint64_t value = data[offset] & 0x3F;
        for (size_t i = 1; i < bytes; i++) {
            value = (value << 8) | data[offset + i];
        }

        return VarIntOffset{value, offset + bytes};
    }

    /**
     * Get encoded size without encoding.
     *
     * @param value Value to measure
     * @return Size in bytes (1, 2, 4, or 8), or 0 if value > MAX_VALUE
     */
    static constexpr size_t encoded_size(uint64_t value) noexcept {
        if (value <= MAX_1_BYTE) return 1;
        if (value <= MAX_2_BYTE) return 2;
        if (value <= MAX_4_BYTE) return 4;
        if (value <= MAX_VALUE) return 8;
        return 0;
    }

    /**
     * Length announced by the first byte of an encoding.
     */
    static constexpr size_t length_from_first_byte(uint8_t first) noexcept {
        return size_t{1} << (first >> 6);
    }

private:
    static constexpr uint8_t length_prefix(size_t bytes) noexcept {
        switch (bytes) {
            case 1: return 0x00;
            case 2: return 0x40;
            case 4: return 0x80;
            default: return 0xC0;
        }
    }
};

} // namespace quic
} // namespace quicwire
