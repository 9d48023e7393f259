/**
 * quicwire Wire Value Type Tests
 *
 * ConnectionID length classes, Version, PacketNumber arithmetic and the
 * packet number helpers (RFC 9000 Appendix A.2 / A.3 examples).
 */

#include <gtest/gtest.h>
#include "../test_utils.h"
#include "src/cpp/quic/quic_types.h"

#include <set>

using namespace quicwire::quic;
using namespace quicwire::core;

class ConnectionIDTest : public QuicWireTest {};

TEST_F(ConnectionIDTest, AcceptsEveryValidLength) {
    for (size_t len : {0, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16, 17, 18}) {
        auto bytes = rng_.random_bytes(len);
        auto cid = ConnectionID::from_bytes(bytes.data(), bytes.size());
        ASSERT_TRUE(cid.is_ok()) << "length " << len;
        EXPECT_EQ(cid.value().size(), len);
        EXPECT_EQ(cid.value().empty(), len == 0);
        if (len > 0) {
            EXPECT_EQ(std::memcmp(cid.value().data(), bytes.data(), len), 0);
        }
    }
}

TEST_F(ConnectionIDTest, RejectsInvalidLengths) {
    uint8_t bytes[32] = {};
    for (size_t len : {1, 2, 3, 19, 20, 32}) {
        auto cid = ConnectionID::from_bytes(bytes, len);
        ASSERT_TRUE(cid.is_err()) << "length " << len;
        EXPECT_EQ(cid.error(), error_code::invalid_field_length);
    }
}

TEST_F(ConnectionIDTest, LengthClassRoundTrip) {
    EXPECT_EQ(ConnectionID::length_from_class(0), 0u);
    for (uint8_t nibble = 1; nibble <= 15; ++nibble) {
        size_t len = ConnectionID::length_from_class(nibble);
        EXPECT_EQ(len, nibble + 3u);
        EXPECT_TRUE(ConnectionID::is_valid_length(len));

        auto bytes = rng_.random_bytes(len);
        auto cid = ConnectionID::from_bytes(bytes.data(), len);
        ASSERT_TRUE(cid.is_ok());
        EXPECT_EQ(cid.value().length_class(), nibble);
    }

    EXPECT_EQ(ConnectionID().length_class(), 0);
}

TEST_F(ConnectionIDTest, EqualityAndOrdering) {
    auto a_bytes = from_hex("01020304");
    auto b_bytes = from_hex("01020305");
    auto c_bytes = from_hex("0102030400");

    auto a = ConnectionID::from_bytes(a_bytes.data(), a_bytes.size()).value();
    auto a2 = ConnectionID::from_bytes(a_bytes.data(), a_bytes.size()).value();
    auto b = ConnectionID::from_bytes(b_bytes.data(), b_bytes.size()).value();
    auto c = ConnectionID::from_bytes(c_bytes.data(), c_bytes.size()).value();

    EXPECT_EQ(a, a2);
    EXPECT_NE(a, b);
    EXPECT_NE(a, c);
    EXPECT_LT(a, b);
    EXPECT_LT(b, c);  // shorter first
    EXPECT_EQ(a.to_hex(), "01020304");
    EXPECT_EQ(ConnectionID().to_hex(), "");
}

TEST_F(ConnectionIDTest, RandomHasRequestedLength) {
    std::set<std::string> seen;
    for (int i = 0; i < 32; ++i) {
        auto cid = ConnectionID::random(8);
        ASSERT_TRUE(cid.is_ok());
        EXPECT_EQ(cid.value().size(), 8u);
        seen.insert(cid.value().to_hex());
    }
    EXPECT_GT(seen.size(), 30u);

    EXPECT_TRUE(ConnectionID::random(0).is_ok());
    EXPECT_TRUE(ConnectionID::random(18).is_ok());

    auto bad = ConnectionID::random(3);
    ASSERT_TRUE(bad.is_err());
    EXPECT_EQ(bad.error(), error_code::invalid_field_length);
}

// =============================================================================
// Version
// =============================================================================

TEST(VersionTest, FromBytesRequiresFourBytes) {
    auto bytes = from_hex("ff00000b");
    auto version = Version::from_bytes(bytes.data(), bytes.size());
    ASSERT_TRUE(version.is_ok());
    EXPECT_EQ(version.value().value(), 0xff00000bu);
    EXPECT_EQ(version.value().size(), 4u);

    for (size_t len : {0, 1, 3, 5}) {
        uint8_t buf[8] = {};
        auto bad = Version::from_bytes(buf, len);
        ASSERT_TRUE(bad.is_err()) << "length " << len;
        EXPECT_EQ(bad.error(), error_code::invalid_field_length);
    }
}

TEST(VersionTest, WriteIsBigEndian) {
    uint8_t out[4];
    Version(0x01020304).write(out);
    EXPECT_EQ(out[0], 0x01);
    EXPECT_EQ(out[1], 0x02);
    EXPECT_EQ(out[2], 0x03);
    EXPECT_EQ(out[3], 0x04);
    EXPECT_EQ(Version(7), Version(7));
    EXPECT_NE(Version(7), Version(8));
}

// =============================================================================
// PacketNumber
// =============================================================================

TEST(PacketNumberTest, FromBytesWidths) {
    auto bytes = from_hex("12345678");

    auto one = PacketNumber::from_bytes(bytes.data(), 1);
    ASSERT_TRUE(one.is_ok());
    EXPECT_EQ(one.value().value(), 0x12u);
    EXPECT_EQ(one.value().width(), 1);

    auto two = PacketNumber::from_bytes(bytes.data(), 2);
    ASSERT_TRUE(two.is_ok());
    EXPECT_EQ(two.value().value(), 0x1234u);

    auto four = PacketNumber::from_bytes(bytes.data(), 4);
    ASSERT_TRUE(four.is_ok());
    EXPECT_EQ(four.value().value(), 0x12345678u);

    auto three = PacketNumber::from_bytes(bytes.data(), 3);
    ASSERT_TRUE(three.is_err());
    EXPECT_EQ(three.error(), error_code::invalid_field_length);
}

TEST(PacketNumberTest, CreateValidatesWidthAndRange) {
    EXPECT_TRUE(PacketNumber::create(1, 4).is_ok());
    EXPECT_TRUE(PacketNumber::create(PacketNumber::MAX_VALUE, 4).is_ok());
    EXPECT_EQ(PacketNumber::create(1, 3).error(), error_code::invalid_field_length);
    EXPECT_EQ(PacketNumber::create(PacketNumber::MAX_VALUE + 1, 4).error(),
              error_code::invalid_field_length);
}

TEST(PacketNumberTest, ArithmeticAndOrdering) {
    auto pn = PacketNumber::create(41, 2).value();
    auto next = pn.next();

    EXPECT_EQ(next.value(), 42u);
    EXPECT_EQ(next.width(), 2);
    EXPECT_LT(pn, next);
    EXPECT_GT(next, pn);
    EXPECT_LE(pn, pn);
    EXPECT_EQ(next - pn, 1u);
    EXPECT_EQ((pn + 100).value(), 141u);

    // Ordering ignores width, equality does not
    auto wide = PacketNumber::create(41, 4).value();
    EXPECT_FALSE(pn < wide);
    EXPECT_FALSE(wide < pn);
    EXPECT_NE(pn, wide);

    auto max = PacketNumber::create(PacketNumber::MAX_VALUE, 4).value();
    EXPECT_EQ(max.next().value(), 0u);
}

TEST(PacketNumberTest, WriteTruncatesToWidth) {
    auto pn = PacketNumber::create(0xABCDEF, 2).value();
    uint8_t out[2];
    pn.write(out);
    EXPECT_EQ(out[0], 0xCD);
    EXPECT_EQ(out[1], 0xEF);
    EXPECT_FALSE(pn.fits_width());
}

TEST(PacketNumberTest, FitsWidthBoundaries) {
    EXPECT_TRUE(PacketNumber::create(0xFF, 1).value().fits_width());
    EXPECT_FALSE(PacketNumber::create(0x100, 1).value().fits_width());
    EXPECT_TRUE(PacketNumber::create(0xFFFF, 2).value().fits_width());
    EXPECT_FALSE(PacketNumber::create(0x10000, 2).value().fits_width());
    EXPECT_TRUE(PacketNumber::create(0xFFFFFFFF, 4).value().fits_width());
    EXPECT_FALSE(PacketNumber::create(0x100000000ULL, 4).value().fits_width());
}

TEST(PacketNumberTest, TruncatedWidthRfcExamples) {
    EXPECT_EQ(truncated_packet_number_width(0xac5c02, 0xabe8b3), 2);
    // Needs 18 bits; there is no 3 byte form
    EXPECT_EQ(truncated_packet_number_width(0xace8fe, 0xabe8b3), 4);
    EXPECT_EQ(truncated_packet_number_width(10, 5), 1);
    EXPECT_EQ(truncated_packet_number_width(0, 0), 1);
}

TEST(PacketNumberTest, TruncatedWidthWithNothingAcknowledged) {
    // Packets 0..full_pn are all outstanding
    EXPECT_EQ(truncated_packet_number_width(0, std::nullopt), 1);
    EXPECT_EQ(truncated_packet_number_width(126, std::nullopt), 1);
    EXPECT_EQ(truncated_packet_number_width(127, std::nullopt), 2);
    EXPECT_EQ(truncated_packet_number_width(127, 0), 1);
    EXPECT_EQ(truncated_packet_number_width(0x8000, std::nullopt), 4);
}

TEST(PacketNumberTest, DecodeRfcExample) {
    EXPECT_EQ(decode_packet_number(0x9b32, 0xa82f30ea, 16), 0xa82f9b32u);
}

TEST(PacketNumberTest, DecodeWrapsAroundWindow) {
    // Expected 0x100, truncated 0x01 is just past the window start
    EXPECT_EQ(decode_packet_number(0x01, 0xff, 8), 0x101u);
    // Candidate above expected + half window goes one window down
    EXPECT_EQ(decode_packet_number(0xfe, 0x100, 8), 0xfeu);
    // Small packet numbers never underflow
    EXPECT_EQ(decode_packet_number(0xff, 0, 8), 0xffu);
    EXPECT_EQ(decode_packet_number(0x05, 0x03, 8), 0x05u);
}

TEST(PacketNumberTest, DecodeRejectsUnsupportedBitCounts) {
    // Only 8, 16 and 32 bit encodings exist; anything else is returned as is
    EXPECT_EQ(decode_packet_number(0x1234, 0xa82f30ea, 0), 0x1234u);
    EXPECT_EQ(decode_packet_number(0x1234, 0xa82f30ea, 24), 0x1234u);
    EXPECT_EQ(decode_packet_number(0x1234, 0xa82f30ea, 64), 0x1234u);
    EXPECT_EQ(decode_packet_number(0x1234, 0xa82f30ea, 255), 0x1234u);
}
