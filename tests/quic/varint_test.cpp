/**
 * quicwire VarInt Tests
 *
 * Variable-length integer encoding: boundaries, minimality, truncation and
 * the decoding examples from RFC 9000 Appendix A.1.
 */

#include <gtest/gtest.h>
#include "../test_utils.h"
#include "src/cpp/quic/quic_varint.h"

#include <limits>

using namespace quicwire::quic;
using namespace quicwire::core;

class VarIntTest : public QuicWireTest {
protected:
    std::vector<uint8_t> encode_ok(uint64_t value) {
        auto encoded = VarInt::encode(value);
        EXPECT_TRUE(encoded.is_ok()) << "value " << value;
        return encoded.is_ok() ? encoded.value() : std::vector<uint8_t>{};
    }
};

// =============================================================================
// Encoding
// =============================================================================

TEST_F(VarIntTest, EncodeBoundaries) {
    EXPECT_EQ(encode_ok(0), from_hex("00"));
    EXPECT_EQ(encode_ok(63), from_hex("3f"));
    EXPECT_EQ(encode_ok(64), from_hex("4040"));
    EXPECT_EQ(encode_ok(16383), from_hex("7fff"));
    EXPECT_EQ(encode_ok(16384), from_hex("80004000"));
    EXPECT_EQ(encode_ok(1073741823), from_hex("bfffffff"));
    EXPECT_EQ(encode_ok(1073741824), from_hex("c000000040000000"));
    EXPECT_EQ(encode_ok(VarInt::MAX_VALUE), from_hex("ffffffffffffffff"));
}

TEST_F(VarIntTest, EncodeMatchesRfcExamples) {
    EXPECT_EQ(encode_ok(151288809941952652ULL), from_hex("c2197c5eff14e88c"));
    EXPECT_EQ(encode_ok(494878333), from_hex("9d7f3e7d"));
    EXPECT_EQ(encode_ok(15293), from_hex("7bbd"));
    EXPECT_EQ(encode_ok(37), from_hex("25"));
}

TEST_F(VarIntTest, EncodeRejectsValuesAbove62Bits) {
    auto too_large = VarInt::encode(VarInt::MAX_VALUE + 1);
    ASSERT_TRUE(too_large.is_err());
    EXPECT_EQ(too_large.error(), error_code::value_too_large);

    auto max = VarInt::encode(std::numeric_limits<uint64_t>::max());
    ASSERT_TRUE(max.is_err());
    EXPECT_EQ(max.error(), error_code::value_too_large);

    EXPECT_EQ(VarInt::encoded_size(VarInt::MAX_VALUE + 1), 0u);
}

TEST_F(VarIntTest, EncodeIntoShortBuffer) {
    uint8_t out[2];
    auto written = VarInt::encode(16384, out, sizeof(out));
    ASSERT_TRUE(written.is_err());
    EXPECT_EQ(written.error(), error_code::truncated_input);

    written = VarInt::encode(16383, out, sizeof(out));
    ASSERT_TRUE(written.is_ok());
    EXPECT_EQ(written.value(), 2u);
    EXPECT_EQ(out[0], 0x7F);
    EXPECT_EQ(out[1], 0xFF);
}

// =============================================================================
// Decoding
// =============================================================================

TEST_F(VarIntTest, DecodeRfcExamples) {
    struct Case {
        const char* hex;
        uint64_t value;
    };
    const Case cases[] = {
        {"c2197c5eff14e88c", 151288809941952652ULL},
        {"9d7f3e7d", 494878333},
        {"7bbd", 15293},
        {"25", 37},
        {"4025", 37},
    };

    for (const auto& c : cases) {
        auto bytes = from_hex(c.hex);
        auto decoded = VarInt::decode(bytes.data(), bytes.size(), 0);
        ASSERT_TRUE(decoded.is_ok()) << c.hex;
        EXPECT_EQ(decoded.value().value, c.value) << c.hex;
        EXPECT_EQ(decoded.value().offset, bytes.size()) << c.hex;
    }
}

TEST_F(VarIntTest, NonCanonicalEncodingDoesNotRoundTripBytes) {
    auto bytes = from_hex("4025");
    auto decoded = VarInt::decode(bytes.data(), bytes.size(), 0);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value().value, 37u);
    EXPECT_EQ(encode_ok(decoded.value().value), from_hex("25"));
}

TEST_F(VarIntTest, DecodeAtOffset) {
    auto bytes = from_hex("aa 4025 ff");
    auto decoded = VarInt::decode(bytes.data(), bytes.size(), 1);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value().value, 37u);
    EXPECT_EQ(decoded.value().offset, 3u);
}

TEST_F(VarIntTest, DecodeTruncatedInput) {
    const std::vector<std::string> full = {
        "7bbd", "9d7f3e7d", "c2197c5eff14e88c"
    };

    for (const auto& hex : full) {
        auto bytes = from_hex(hex);
        for (size_t cut = 1; cut < bytes.size(); ++cut) {
            auto decoded = VarInt::decode(bytes.data(), cut, 0);
            ASSERT_TRUE(decoded.is_err()) << hex << " cut at " << cut;
            EXPECT_EQ(decoded.error(), error_code::truncated_input);
        }
    }
}

TEST_F(VarIntTest, DecodeAtEndOfBuffer) {
    auto bytes = from_hex("25");
    auto decoded = VarInt::decode(bytes.data(), bytes.size(), 1);
    ASSERT_TRUE(decoded.is_err());
    EXPECT_EQ(decoded.error(), error_code::truncated_input);

    decoded = VarInt::decode(nullptr, 0, 0);
    ASSERT_TRUE(decoded.is_err());
    EXPECT_EQ(decoded.error(), error_code::truncated_input);
}

// =============================================================================
// Round trip and minimality
// =============================================================================

TEST_F(VarIntTest, RoundTripAcrossRanges) {
    const uint64_t limits[] = {
        VarInt::MAX_1_BYTE, VarInt::MAX_2_BYTE, VarInt::MAX_4_BYTE, VarInt::MAX_VALUE
    };

    for (uint64_t limit : limits) {
        for (int i = 0; i < 500; ++i) {
            uint64_t value = rng_.random_u64(0, limit);
            auto bytes = encode_ok(value);

            EXPECT_EQ(bytes.size(), VarInt::encoded_size(value));
            EXPECT_EQ(bytes.size(), VarInt::length_from_first_byte(bytes[0]));

            auto decoded = VarInt::decode(bytes.data(), bytes.size(), 0);
            ASSERT_TRUE(decoded.is_ok());
            EXPECT_EQ(decoded.value().value, value);
            EXPECT_EQ(decoded.value().offset, bytes.size());
        }
    }
}

TEST_F(VarIntTest, EncodedSizeIsMinimal) {
    EXPECT_EQ(VarInt::encoded_size(0), 1u);
    EXPECT_EQ(VarInt::encoded_size(63), 1u);
    EXPECT_EQ(VarInt::encoded_size(64), 2u);
    EXPECT_EQ(VarInt::encoded_size(16383), 2u);
    EXPECT_EQ(VarInt::encoded_size(16384), 4u);
    EXPECT_EQ(VarInt::encoded_size(1073741823), 4u);
    EXPECT_EQ(VarInt::encoded_size(1073741824), 8u);
    EXPECT_EQ(VarInt::encoded_size(VarInt::MAX_VALUE), 8u);
}
