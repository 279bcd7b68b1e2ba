/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <dfms/checksum.hpp>
#include <dfms/error.hpp>
#include <dfms/node/node.hpp>

#include "utils.hpp"

using namespace dfms;

class NodeTest : public ::testing::Test {
  protected:
    void SetUp() override {
        channel = make_channel();
        node = make_data_node("n", channel);
        listener = std::make_shared<RecordingListener>("observer");
        node->add_consumer(listener);
    }

    std::shared_ptr<EventChannel> channel;
    std::shared_ptr<Node> node;
    std::shared_ptr<RecordingListener> listener;
};

TEST_F(NodeTest, StartsInitialized) {
    EXPECT_EQ(node->state(), NodeState::INITIALIZED);
    EXPECT_EQ(node->size(), 0);
    EXPECT_EQ(node->checksum(), 0u);
    EXPECT_FALSE(node->is_container());
    EXPECT_TRUE(node->children().empty());
}

TEST_F(NodeTest, WriteMovesToWriting) {
    EXPECT_EQ(node->write(std::string{"abc"}), 3);
    EXPECT_EQ(node->state(), NodeState::WRITING);
    EXPECT_EQ(node->bytes_written(), 3);
    EXPECT_TRUE(listener->events().empty());
}

TEST_F(NodeTest, FinalizePublishesOneCompleteEvent) {
    node->write(std::string{"abc"});
    node->finalize();
    EXPECT_EQ(node->state(), NodeState::COMPLETE);
    auto events = listener->events();
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(events[0].source, "n");
    EXPECT_EQ(events[0].kind, EventKind::COMPLETE);
    EXPECT_GT(events[0].timestamp, 0);
}

TEST_F(NodeTest, FinalizeWithoutWrites) {
    node->finalize();
    EXPECT_EQ(node->state(), NodeState::COMPLETE);
    EXPECT_EQ(read_all_text(*node), "");
}

TEST_F(NodeTest, IllegalTransitionsAfterComplete) {
    node->finalize();
    EXPECT_THROW(node->write(std::string{"x"}), invalid_state_transition);
    EXPECT_THROW(node->finalize(), invalid_state_transition);
    // Failing a terminal node is a no-op.
    node->fail("too late");
    EXPECT_EQ(node->state(), NodeState::COMPLETE);
    EXPECT_EQ(listener->events().size(), 1);
}

TEST_F(NodeTest, FailPublishesOneErrorEvent) {
    node->write(std::string{"partial"});
    node->fail("disk on fire");
    EXPECT_EQ(node->state(), NodeState::ERROR);
    EXPECT_EQ(node->cause(), "disk on fire");
    node->fail("again");
    EXPECT_EQ(node->cause(), "disk on fire");

    auto events = listener->events();
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(events[0].kind, EventKind::ERROR);

    EXPECT_THROW(node->write(std::string{"x"}), node_failed);
    EXPECT_THROW(node->finalize(), node_failed);
    EXPECT_THROW(static_cast<void>(node->open()), node_failed);
}

TEST_F(NodeTest, ReadOnlyWhenComplete) {
    node->write(std::string{"abc"});
    EXPECT_THROW(static_cast<void>(node->open()), invalid_state_transition);
    node->finalize();
    EXPECT_EQ(read_all_text(*node), "abc");
    // Several readers may read concurrently.
    auto h1 = node->open();
    auto h2 = node->open();
    EXPECT_NE(h1, h2);
    EXPECT_EQ(node->read(h1, 2), to_bytes("ab"));
    EXPECT_EQ(node->read(h2, 3), to_bytes("abc"));
    EXPECT_EQ(node->read(h1, 10), to_bytes("c"));
    EXPECT_TRUE(node->read(h1, 10).empty());
    node->close(h1);
    node->close(h2);
    EXPECT_THROW(static_cast<void>(node->read(h1, 1)), std::out_of_range);
    EXPECT_THROW(node->close(h1), std::out_of_range);
}

TEST_F(NodeTest, ChecksumIsIndependentOfChunking) {
    std::string const data = "the quick brown fox jumps over the lazy dog";
    auto other = make_data_node("other", channel);
    node->write(data);
    for (std::size_t i = 0; i < data.size(); i += 5) {
        other->write(data.substr(i, 5));
    }
    EXPECT_EQ(node->checksum(), other->checksum());
    EXPECT_EQ(node->checksum(), crc32(data));
    EXPECT_EQ(other->size(), data.size());
}

TEST_F(NodeTest, ExpireFromAnyState) {
    node->write(std::string{"abc"});
    EXPECT_TRUE(node->expire());  // Was writing.
    EXPECT_EQ(node->state(), NodeState::EXPIRED);
    EXPECT_FALSE(node->expire());
    EXPECT_THROW(node->write(std::string{"x"}), invalid_state_transition);
    EXPECT_THROW(static_cast<void>(node->open()), invalid_state_transition);
    // Expiry is not a data event.
    EXPECT_TRUE(listener->events().empty());

    auto idle = make_data_node("idle", channel);
    EXPECT_FALSE(idle->expire());
    EXPECT_EQ(idle->state(), NodeState::EXPIRED);
}

TEST(Node, ExpectedSizeAutoFinalizes) {
    auto channel = make_channel();
    auto node = make_data_node("sized", channel, 5);
    auto listener = std::make_shared<RecordingListener>("observer");
    node->add_consumer(listener);

    EXPECT_EQ(node->write(std::string{"abc"}), 3);
    EXPECT_EQ(node->state(), NodeState::WRITING);
    // Longer writes are truncated to the expected size.
    EXPECT_EQ(node->write(std::string{"defgh"}), 2);
    EXPECT_EQ(node->state(), NodeState::COMPLETE);
    EXPECT_EQ(listener->events().size(), 1);
    EXPECT_EQ(read_all_text(*node), "abcde");
    EXPECT_THROW(node->write(std::string{"x"}), invalid_state_transition);
}

TEST(Node, ExpectedSizeZeroAcceptsNothing) {
    auto node = make_data_node("empty", make_channel(), 0);
    EXPECT_EQ(node->write(std::string{"abc"}), 0);
    EXPECT_EQ(node->state(), NodeState::COMPLETE);
}

TEST(Node, LateSubscriberGetsReplay) {
    auto channel = make_channel();
    auto node = make_data_node("n", channel);
    node->finalize();
    auto late = std::make_shared<RecordingListener>("late");
    node->add_consumer(late);
    auto events = late->events();
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(events[0].kind, EventKind::COMPLETE);

    auto failed = make_data_node("f", channel);
    failed->fail("broken");
    auto late2 = std::make_shared<RecordingListener>("late");
    failed->add_consumer(late2);
    ASSERT_EQ(late2->events().size(), 1);
    EXPECT_EQ(late2->events()[0].kind, EventKind::ERROR);
}

TEST(Node, DuplicateConsumerRejected) {
    auto node = make_data_node("n", make_channel());
    node->add_consumer(std::make_shared<RecordingListener>("c"));
    EXPECT_THROW(
        node->add_consumer(std::make_shared<RecordingListener>("c")), duplicate_consumer
    );
    EXPECT_THAT(node->consumers(), ::testing::ElementsAre("c"));
}

TEST(Node, DataNodesDoNotConsume) {
    auto channel = make_channel();
    auto a = make_data_node("a", channel);
    auto b = make_data_node("b", channel);
    EXPECT_THROW(a->add_consumer(b), std::invalid_argument);
}
