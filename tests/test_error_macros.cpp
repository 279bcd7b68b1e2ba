/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include <dfms/error.hpp>

/*
 * DFMS macros are not public API and should not be used externally, but we test
 * them to avoid regressions anyway.
 */

TEST(ErrorMacrosTest, ExpectsNoThrow) {
    EXPECT_NO_THROW(DFMS_EXPECTS(true, "This should not throw"));
    EXPECT_NO_THROW(DFMS_EXPECTS(true, "This should not throw", std::runtime_error));
}

TEST(ErrorMacrosTest, ExpectsThrow) {
    EXPECT_THROW(DFMS_EXPECTS(false, "Expected exception"), std::logic_error);
    EXPECT_THROW(
        DFMS_EXPECTS(false, "Expected runtime error", std::runtime_error),
        std::runtime_error
    );
    EXPECT_THROW(
        DFMS_EXPECTS(false, "Expected unknown node", dfms::unknown_node),
        dfms::unknown_node
    );
}

TEST(ErrorMacrosTest, FailThrow) {
    EXPECT_THROW(DFMS_FAIL("This should throw logic_error"), std::logic_error);
    EXPECT_THROW(DFMS_FAIL("This should throw", dfms::delivery_error), dfms::delivery_error);
}

TEST(ErrorMacrosTest, ErrorMessages) {
    try {
        DFMS_EXPECTS(false, "Test message");
        FAIL() << "Expected DFMS_EXPECTS to throw an exception";
    } catch (const std::logic_error& e) {
        std::string error_message = e.what();
        EXPECT_NE(error_message.find("DFMS failure at:"), std::string::npos);
        EXPECT_NE(error_message.find("Test message"), std::string::npos);
    }

    try {
        DFMS_FAIL("Test failure message", dfms::resource_unavailable);
        FAIL() << "Expected DFMS_FAIL to throw an exception";
    } catch (const dfms::resource_unavailable& e) {
        std::string error_message = e.what();
        EXPECT_NE(error_message.find("DFMS failure at:"), std::string::npos);
        EXPECT_NE(error_message.find("Test failure message"), std::string::npos);
    }
}

// Callers catch the standard base classes, so the hierarchy is part of the API.
TEST(ErrorMacrosTest, ExceptionHierarchy) {
    EXPECT_THROW(DFMS_FAIL("failed", dfms::node_failed), dfms::invalid_state_transition);
    EXPECT_THROW(DFMS_FAIL("failed", dfms::node_failed), std::logic_error);
    EXPECT_THROW(
        DFMS_FAIL("duplicate", dfms::duplicate_consumer), std::invalid_argument
    );
    EXPECT_THROW(
        DFMS_FAIL("cycle", dfms::graph_construction_error), std::invalid_argument
    );
    EXPECT_THROW(DFMS_FAIL("unknown", dfms::unknown_node), std::out_of_range);
    EXPECT_THROW(DFMS_FAIL("full", dfms::resource_unavailable), std::runtime_error);
    EXPECT_THROW(DFMS_FAIL("lost", dfms::delivery_error), std::runtime_error);
}
