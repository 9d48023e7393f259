/**
 * @file result_test.cpp
 * @brief Google Test suite for result<T> and error_code
 */

#include <gtest/gtest.h>
#include "../test_utils.h"
#include "src/cpp/core/result.h"

#include <memory>
#include <string>
#include <vector>

using namespace quicwire::core;

class ResultTest : public QuicWireTest {};

TEST_F(ResultTest, ValueResult) {
    result<int> r = 42;
    EXPECT_TRUE(r.is_ok());
    EXPECT_FALSE(r.is_err());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
    EXPECT_EQ(r.error(), error_code::success);
}

TEST_F(ResultTest, ErrorResult) {
    result<int> r = error_code::truncated_input;
    EXPECT_TRUE(r.is_err());
    EXPECT_FALSE(static_cast<bool>(r));
    EXPECT_EQ(r.error(), error_code::truncated_input);
    EXPECT_EQ(std::move(r).value_or(7), 7);
}

TEST_F(ResultTest, DefaultIsInternalError) {
    result<std::string> r;
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.error(), error_code::internal_error);
}

TEST_F(ResultTest, CopyAndMoveKeepValue) {
    std::vector<uint8_t> bytes = rng_.random_bytes(64);
    result<std::vector<uint8_t>> original = bytes;

    result<std::vector<uint8_t>> copy = original;
    ASSERT_TRUE(copy.is_ok());
    EXPECT_EQ(copy.value(), bytes);

    result<std::vector<uint8_t>> moved = std::move(original);
    ASSERT_TRUE(moved.is_ok());
    EXPECT_EQ(moved.value(), bytes);

    moved = error_code::value_too_large;
    EXPECT_EQ(moved.error(), error_code::value_too_large);

    moved = copy;
    ASSERT_TRUE(moved.is_ok());
    EXPECT_EQ(moved.value(), bytes);
}

TEST_F(ResultTest, MoveOnlyValue) {
    result<std::unique_ptr<int>> r = std::make_unique<int>(5);
    ASSERT_TRUE(r.is_ok());

    std::unique_ptr<int> owned = std::move(r).value();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 5);
}

TEST_F(ResultTest, VoidResult) {
    result<void> good = ok();
    EXPECT_TRUE(good.is_ok());

    result<void> bad = err(error_code::protocol_violation);
    EXPECT_TRUE(bad.is_err());
    EXPECT_EQ(bad.error(), error_code::protocol_violation);
}

TEST_F(ResultTest, Helpers) {
    auto good = ok<uint64_t>(9);
    EXPECT_EQ(good.value(), 9u);

    auto bad = err<uint64_t>(error_code::invalid_field_length);
    EXPECT_EQ(bad.error(), error_code::invalid_field_length);
}

TEST_F(ResultTest, ErrorNames) {
    EXPECT_STREQ(error_code_to_string(error_code::success), "success");
    EXPECT_STREQ(error_code_to_string(error_code::truncated_input), "truncated_input");
    EXPECT_STREQ(error_code_to_string(error_code::invalid_packet_number_width),
                 "invalid_packet_number_width");
    EXPECT_STREQ(error_code_to_string(error_code::internal_error), "internal_error");
}
