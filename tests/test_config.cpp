/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>
#include <string>
#include <unordered_map>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <dfms/config.hpp>

using namespace dfms::config;

TEST(ConfigEnvironmentVariables, ReturnsMatchingVariables) {
    setenv("DFMS_TEST_VAR1", "value1", 1);
    setenv("DFMS_TEST_VAR2", "value2", 1);
    setenv("OTHER_VAR", "should_not_match", 1);

    auto env_vars = get_environment_variables("DFMS_(.*)");

    // The prefix is stripped.
    ASSERT_TRUE(env_vars.contains("TEST_VAR1"));
    ASSERT_TRUE(env_vars.contains("TEST_VAR2"));
    EXPECT_EQ(env_vars["TEST_VAR1"], "value1");
    EXPECT_EQ(env_vars["TEST_VAR2"], "value2");
    EXPECT_FALSE(env_vars.contains("OTHER_VAR"));
}

TEST(ConfigEnvironmentVariables, DoesNotOverwriteExistingKey) {
    setenv("DFMS_EXISTING_VAR", "env_value", 1);

    std::unordered_map<std::string, std::string> output;
    output["EXISTING_VAR"] = "original_value";
    get_environment_variables(output, "DFMS_(.*)");
    EXPECT_EQ(output["EXISTING_VAR"], "original_value");
}

TEST(ConfigEnvironmentVariables, ThrowsIfNoCaptureGroup) {
    EXPECT_THROW(get_environment_variables("DFMS_.*"), std::invalid_argument);
}

TEST(OptionsTest, UnsetOptionUsesDefault) {
    Options opts;
    EXPECT_EQ(opts.get<int>("delivery_retries", default_factory<int>(3)), 3);
    EXPECT_EQ(
        opts.get<std::string>("storage_dir", default_factory<std::string>("/tmp")), "/tmp"
    );
}

TEST(OptionsTest, KeysAreCaseInsensitive) {
    Options opts(std::unordered_map<std::string, std::string>{{"Manager_Capacity", "8"}}
    );
    EXPECT_EQ(opts.get<std::size_t>("MANAGER_CAPACITY", default_factory<std::size_t>(0)), 8);

    std::unordered_map<std::string, std::string> clash = {
        {"key", "lower-key"}, {"KEY", "upper-key"}
    };
    EXPECT_THROW(Options{clash}, std::invalid_argument);
}

TEST(OptionsTest, GetOptionWrongTypeThrows) {
    Options opts(std::unordered_map<std::string, std::string>{{"rpc_timeout", "1.5"}});
    EXPECT_DOUBLE_EQ(opts.get<double>("rpc_timeout", default_factory<double>(10)), 1.5);
    // Parsed once as a double, the option cannot be read as another type.
    EXPECT_THROW(
        static_cast<void>(opts.get<int>("rpc_timeout", default_factory<int>(10))),
        std::invalid_argument
    );
}

TEST(OptionsTest, UnparsableValueThrows) {
    Options opts(std::unordered_map<std::string, std::string>{{"statistics", "maybe"}});
    EXPECT_THROW(
        static_cast<void>(opts.get<bool>("statistics", default_factory<bool>(false))),
        std::invalid_argument
    );
}

TEST(OptionsTest, CopiesShareState) {
    Options opts;
    Options copy = opts;
    EXPECT_TRUE(copy.insert_if_absent("log_level", "DEBUG"));
    EXPECT_FALSE(opts.insert_if_absent("LOG_LEVEL", "TRACE"));
    EXPECT_EQ(opts.get_strings().at("log_level"), "DEBUG");
}

TEST(OptionsTest, InsertIfAbsentCountsInserted) {
    Options opts(std::unordered_map<std::string, std::string>{{"a", "1"}});
    EXPECT_EQ(opts.insert_if_absent({{"a", "2"}, {"b", "3"}, {"c", "4"}}), 2);
    auto strings = opts.get_strings();
    EXPECT_EQ(strings.size(), 3);
    EXPECT_EQ(strings["a"], "1");
}

TEST(OptionsTest, SerializeDeserializeRoundTrip) {
    std::unordered_map<std::string, std::string> strings = {
        {"alpha", "1"}, {"beta", "two"}, {"gamma", "3.14"}, {"empty", ""}
    };
    auto roundtrip = Options::deserialize(Options(strings).serialize()).get_strings();
    EXPECT_EQ(roundtrip, strings);
}

TEST(OptionsTest, SerializeIsDeterministic) {
    std::unordered_map<std::string, std::string> strings = {
        {"x", "1"}, {"y", "2"}, {"z", "3"}
    };
    EXPECT_EQ(Options(strings).serialize(), Options(strings).serialize());
}

TEST(OptionsTest, SerializeEmptyOptions) {
    auto buffer = Options{}.serialize();
    // Prelude, count and CRC trailer.
    EXPECT_EQ(buffer.size(), 8 + sizeof(std::uint64_t) + 4);
    EXPECT_THAT(
        std::vector<std::uint8_t>(buffer.begin(), buffer.begin() + 4),
        testing::ElementsAre('D', 'F', 'M', 'S')
    );
    EXPECT_TRUE(Options::deserialize(buffer).get_strings().empty());
}

TEST(OptionsTest, DeserializeRejectsBadBuffers) {
    EXPECT_THROW(
        static_cast<void>(Options::deserialize(std::vector<std::uint8_t>(4))),
        std::invalid_argument
    );

    auto buffer =
        Options(std::unordered_map<std::string, std::string>{{"key", "value"}}).serialize();

    auto bad_magic = buffer;
    bad_magic[0] = 'X';
    EXPECT_THROW(
        static_cast<void>(Options::deserialize(bad_magic)), std::invalid_argument
    );

    auto bad_version = buffer;
    bad_version[4] = 42;
    EXPECT_THROW(
        static_cast<void>(Options::deserialize(bad_version)), std::invalid_argument
    );

    // Flip a byte of the value, the CRC trailer no longer matches.
    auto corrupted = buffer;
    corrupted[corrupted.size() - 5] ^= 0xFF;
    EXPECT_THROW(
        static_cast<void>(Options::deserialize(corrupted)), std::invalid_argument
    );
}

TEST(OptionsTest, SerializeThrowsIfOptionValueIsSet) {
    Options opts(std::unordered_map<std::string, std::string>{{"level", "5"}});
    static_cast<void>(opts.get<int>("level", default_factory<int>(0)));
    EXPECT_THROW(static_cast<void>(opts.serialize()), std::invalid_argument);
}
