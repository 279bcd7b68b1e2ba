/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdint>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <dfms/checksum.hpp>
#include <dfms/node/types.hpp>
#include <dfms/utils.hpp>

using namespace dfms;

TEST(ParseStringTest, ParsesNumbers) {
    EXPECT_EQ(parse_string<int>("42"), 42);
    EXPECT_EQ(parse_string<std::size_t>("65536"), 65536);
    EXPECT_DOUBLE_EQ(parse_string<double>("0.25"), 0.25);
    EXPECT_THROW(parse_string<int>("abc"), std::invalid_argument);
}

TEST(ParseStringTest, ParsesBooleans) {
    EXPECT_TRUE(parse_string<bool>("1"));
    EXPECT_FALSE(parse_string<bool>("0"));
    EXPECT_TRUE(parse_string<bool>(" YES "));
    EXPECT_FALSE(parse_string<bool>("\toFf\n"));
    EXPECT_THROW(parse_string<bool>("not_a_bool"), std::invalid_argument);
}

TEST(StringUtilsTest, TrimAndCase) {
    EXPECT_EQ(trim("  a b \n"), "a b");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(to_lower("MiXeD"), "mixed");
    EXPECT_EQ(to_upper("MiXeD"), "MIXED");
}

TEST(FormatTest, Bytes) {
    EXPECT_EQ(format_nbytes(512), "512.00 B");
    EXPECT_EQ(format_nbytes(2048), "2.00 KiB");
}

TEST(Checksum, KnownValues) {
    // The standard CRC-32 check value.
    EXPECT_EQ(crc32("123456789"), 0xCBF43926u);
    EXPECT_EQ(crc32(""), 0u);
}

TEST(Checksum, ChunkingDoesNotMatter) {
    std::string const text = "first line\nwe have an a here\nand another one\n";
    auto const whole = crc32(text);
    for (std::size_t split = 0; split <= text.size(); ++split) {
        auto const head = crc32(std::string_view{text}.substr(0, split));
        EXPECT_EQ(crc32(std::string_view{text}.substr(split), head), whole);
    }
}

TEST(NodeTypes, NamesRoundTrip) {
    EXPECT_EQ(node_kind_from_string(" Consumer "), NodeKind::CONSUMER);
    EXPECT_EQ(storage_kind_from_string("file"), StorageKind::FILE);
    EXPECT_THROW(node_kind_from_string("graph"), std::invalid_argument);
    EXPECT_STREQ(to_string(NodeState::EXPIRED), "EXPIRED");
    EXPECT_TRUE(is_terminal(NodeState::ERROR));
    EXPECT_FALSE(is_terminal(NodeState::WRITING));
}
