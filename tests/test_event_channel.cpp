/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <memory>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <dfms/error.hpp>
#include <dfms/node/event_channel.hpp>

#include "utils.hpp"

using namespace dfms;

TEST(EventChannel, PublishReachesSubscribersInOrder) {
    auto channel = make_channel();
    auto a = std::make_shared<RecordingListener>("a");
    auto b = std::make_shared<RecordingListener>("b");
    channel->subscribe("src", a);
    channel->subscribe("src", b);
    channel->subscribe("other", std::make_shared<RecordingListener>("c"));

    EXPECT_EQ(channel->publish(Event::now("src", EventKind::COMPLETE)), 2);
    EXPECT_EQ(a->events().size(), 1);
    EXPECT_EQ(b->events().size(), 1);
    EXPECT_EQ(channel->num_subscribers("src"), 2);
    EXPECT_TRUE(channel->is_subscribed("src", "b"));
    EXPECT_FALSE(channel->is_subscribed("src", "c"));
}

TEST(EventChannel, PublishWithoutSubscribers) {
    auto channel = make_channel();
    EXPECT_EQ(channel->publish(Event::now("nobody", EventKind::ERROR)), 0);
}

TEST(EventChannel, DuplicateSubscriptionRejected) {
    auto channel = make_channel();
    channel->subscribe("src", std::make_shared<RecordingListener>("a"));
    EXPECT_THROW(
        channel->subscribe("src", std::make_shared<RecordingListener>("a")),
        duplicate_consumer
    );
    // The same listener id may listen to another source.
    EXPECT_NO_THROW(channel->subscribe("src2", std::make_shared<RecordingListener>("a")));
}

TEST(EventChannel, FailingListenerIsMarkedBroken) {
    auto stats = std::make_shared<Statistics>();
    auto channel = make_channel(stats);
    auto bad = std::make_shared<RecordingListener>("bad");
    auto good = std::make_shared<RecordingListener>("good");
    bad->set_fail(true);
    channel->subscribe("src", bad);
    channel->subscribe("src", good);

    // Delivery to the other listeners goes on.
    EXPECT_EQ(channel->publish(Event::now("src", EventKind::COMPLETE)), 1);
    EXPECT_EQ(good->events().size(), 1);
    EXPECT_THAT(
        channel->broken_edges(),
        ::testing::ElementsAre(EventChannel::Edge{"src", "bad"})
    );
    EXPECT_EQ(stats->get_stat("broken-edges").value(), 1);

    // A broken edge receives nothing more, even once the listener recovers.
    bad->set_fail(false);
    channel->publish(Event::now("src", EventKind::COMPLETE));
    EXPECT_TRUE(bad->events().empty());
    EXPECT_EQ(good->events().size(), 2);
}

TEST(EventChannel, UnsubscribeAll) {
    auto channel = make_channel();
    auto a = std::make_shared<RecordingListener>("a");
    channel->subscribe("src", a);
    channel->unsubscribe_all("src");
    EXPECT_EQ(channel->num_subscribers("src"), 0);
    EXPECT_EQ(channel->publish(Event::now("src", EventKind::COMPLETE)), 0);
    EXPECT_TRUE(a->events().empty());
}

TEST(EventChannel, ListenerMayPublishFromDelivery) {
    auto channel = make_channel();
    auto a = make_data_node("a", channel);
    auto b = make_data_node("b", channel);
    auto observer = std::make_shared<RecordingListener>("observer");
    b->add_consumer(observer);

    // A listener on `a` that completes `b` from inside the delivery.
    class Chain final : public EventListener {
      public:
        explicit Chain(std::shared_ptr<Node> next) : next_{std::move(next)} {}

        std::string const& listener_id() const noexcept override {
            return id_;
        }

        void deliver(Event const&) override {
            next_->finalize();
        }

      private:
        std::shared_ptr<Node> next_;
        std::string const id_{"chain"};
    };
    a->add_consumer(std::make_shared<Chain>(b));
    a->finalize();
    EXPECT_EQ(b->state(), NodeState::COMPLETE);
    EXPECT_EQ(observer->events().size(), 1);
}
