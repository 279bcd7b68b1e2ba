/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <dfms/error.hpp>
#include <dfms/node/container_node.hpp>

#include "utils.hpp"

using namespace dfms;

namespace {

std::shared_ptr<ContainerNode> make_container(
    std::string id,
    std::shared_ptr<EventChannel> channel,
    std::optional<std::size_t> num_children = std::nullopt
) {
    return std::make_shared<ContainerNode>(
        identity(std::move(id)), std::move(channel), num_children
    );
}

}  // namespace

TEST(ContainerNode, CompletesAfterLastChild) {
    auto channel = make_channel();
    auto container = make_container("c", channel);
    auto observer = std::make_shared<RecordingListener>("observer");
    container->add_consumer(observer);

    std::vector<std::shared_ptr<Node>> children;
    for (int i = 0; i < 3; ++i) {
        children.push_back(make_data_node("child" + std::to_string(i), channel));
        container->add_child(children.back());
    }
    EXPECT_TRUE(container->is_container());
    EXPECT_EQ(container->outstanding(), 4);
    container->seal();
    EXPECT_TRUE(container->sealed());
    EXPECT_EQ(container->outstanding(), 3);

    children[2]->finalize();
    children[0]->finalize();
    EXPECT_EQ(container->state(), NodeState::INITIALIZED);
    EXPECT_EQ(container->outstanding(), 1);
    children[1]->finalize();
    EXPECT_EQ(container->state(), NodeState::COMPLETE);
    EXPECT_EQ(container->outstanding(), 0);
    EXPECT_EQ(observer->events().size(), 1);

    // Children are kept in insertion order.
    auto kids = container->children();
    ASSERT_EQ(kids.size(), 3);
    EXPECT_EQ(kids[0]->instance_id(), "child0");
    EXPECT_EQ(kids[2]->instance_id(), "child2");
}

TEST(ContainerNode, ChildAlreadyCompleteCounts) {
    auto channel = make_channel();
    auto container = make_container("c", channel, 2);
    auto done = make_data_node("done", channel);
    done->finalize();
    container->add_child(done);
    EXPECT_EQ(container->outstanding(), 1);

    auto pending = make_data_node("pending", channel);
    container->add_child(pending);
    pending->finalize();
    EXPECT_EQ(container->state(), NodeState::COMPLETE);
}

TEST(ContainerNode, FailingChildFailsFast) {
    auto channel = make_channel();
    auto container = make_container("c", channel);
    auto observer = std::make_shared<RecordingListener>("observer");
    container->add_consumer(observer);

    auto a = make_data_node("a", channel);
    auto b = make_data_node("b", channel);
    container->add_child(a);
    container->add_child(b);

    b->fail("oops");
    EXPECT_EQ(container->state(), NodeState::ERROR);
    // Later completions change nothing.
    a->finalize();
    EXPECT_EQ(container->state(), NodeState::ERROR);
    auto events = observer->events();
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(events[0].kind, EventKind::ERROR);
}

TEST(ContainerNode, RepeatedEventsAreIgnored) {
    auto channel = make_channel();
    auto container = make_container("c", channel, 2);
    auto a = make_data_node("a", channel);
    auto b = make_data_node("b", channel);
    container->add_child(a);
    container->add_child(b);
    a->finalize();
    // The same child completing twice must not count twice.
    container->handle_event(Event::now("a", EventKind::COMPLETE));
    EXPECT_EQ(container->state(), NodeState::INITIALIZED);
    EXPECT_EQ(container->outstanding(), 1);
    b->finalize();
    EXPECT_EQ(container->state(), NodeState::COMPLETE);
}

TEST(ContainerNode, InvalidChildren) {
    auto channel = make_channel();
    auto container = make_container("c", channel, 1);
    auto a = make_data_node("a", channel);
    container->add_child(a);
    EXPECT_THROW(container->add_child(a), duplicate_consumer);
    EXPECT_THROW(container->add_child(make_data_node("b", channel)), invalid_state_transition);
    EXPECT_THROW(container->add_child(container), std::invalid_argument);
    EXPECT_THROW(
        container->handle_event(Event::now("stranger", EventKind::COMPLETE)),
        std::invalid_argument
    );
}

TEST(ContainerNode, IsNotWritable) {
    auto container = make_container("c", make_channel());
    EXPECT_THROW(container->write(std::string{"x"}), invalid_state_transition);
}

TEST(ContainerNode, NestedContainers) {
    auto channel = make_channel();
    auto outer = make_container("outer", channel, 2);
    auto inner = make_container("inner", channel, 1);
    auto a = make_data_node("a", channel);
    auto b = make_data_node("b", channel);
    inner->add_child(a);
    outer->add_child(inner);
    outer->add_child(b);

    b->finalize();
    EXPECT_EQ(outer->state(), NodeState::INITIALIZED);
    a->finalize();
    EXPECT_EQ(inner->state(), NodeState::COMPLETE);
    EXPECT_EQ(outer->state(), NodeState::COMPLETE);
}

// Children complete from many threads at once, the container completes exactly once.
TEST(ContainerNode, ConcurrentChildCompletion) {
    constexpr std::size_t num_children = 64;
    for (int round = 0; round < 20; ++round) {
        auto channel = make_channel();
        auto container = make_container("c", channel, num_children);
        auto observer = std::make_shared<RecordingListener>("observer");
        container->add_consumer(observer);

        std::vector<std::shared_ptr<Node>> children;
        for (std::size_t i = 0; i < num_children; ++i) {
            children.push_back(make_data_node("child" + std::to_string(i), channel));
            container->add_child(children.back());
        }
        std::shuffle(
            children.begin(), children.end(), std::mt19937{static_cast<unsigned>(round)}
        );

        std::vector<std::thread> threads;
        for (std::size_t t = 0; t < 8; ++t) {
            threads.emplace_back([&, t] {
                for (std::size_t i = t; i < num_children; i += 8) {
                    children[i]->finalize();
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        EXPECT_EQ(container->state(), NodeState::COMPLETE);
        EXPECT_EQ(container->outstanding(), 0);
        EXPECT_EQ(observer->events().size(), 1);
    }
}

// Children completing while others are still being added cannot complete the
// container early when the number of children is declared.
TEST(ContainerNode, DeclaredCountGuardsEarlyCompletion) {
    auto channel = make_channel();
    auto container = make_container("c", channel, 3);
    auto a = make_data_node("a", channel);
    container->add_child(a);
    a->finalize();
    EXPECT_EQ(container->state(), NodeState::INITIALIZED);
    auto b = make_data_node("b", channel);
    auto c = make_data_node("c2", channel);
    container->add_child(b);
    container->add_child(c);
    b->finalize();
    c->finalize();
    EXPECT_EQ(container->state(), NodeState::COMPLETE);
}

// An open container cannot complete, even when every child added so far did.
TEST(ContainerNode, OpenContainerWaitsForSeal) {
    auto channel = make_channel();
    auto container = make_container("c", channel);
    auto observer = std::make_shared<RecordingListener>("observer");
    container->add_consumer(observer);
    EXPECT_FALSE(container->sealed());

    auto a = make_data_node("a", channel);
    a->finalize();
    container->add_child(a);
    EXPECT_EQ(container->state(), NodeState::INITIALIZED);

    auto b = make_data_node("b", channel);
    container->add_child(b);
    b->finalize();
    EXPECT_EQ(container->state(), NodeState::INITIALIZED);

    auto late = make_data_node("late", channel);
    container->add_child(late);
    container->seal();
    EXPECT_EQ(container->state(), NodeState::INITIALIZED);
    EXPECT_THROW(
        container->add_child(make_data_node("d", channel)), invalid_state_transition
    );
    late->finalize();
    EXPECT_EQ(container->state(), NodeState::COMPLETE);
    EXPECT_EQ(observer->events().size(), 1);
    EXPECT_EQ(container->children().size(), 3);
}

TEST(ContainerNode, SealCompletesWhenChildrenAreDone) {
    auto channel = make_channel();
    auto container = make_container("c", channel);
    auto a = make_data_node("a", channel);
    container->add_child(a);
    a->finalize();
    EXPECT_EQ(container->state(), NodeState::INITIALIZED);
    container->seal();
    EXPECT_EQ(container->state(), NodeState::COMPLETE);
    // Sealing again changes nothing.
    container->seal();
    EXPECT_EQ(container->outstanding(), 0);
}

TEST(ContainerNode, SealedEmptyContainerDoesNotComplete) {
    auto channel = make_channel();
    auto container = make_container("c", channel);
    container->seal();
    EXPECT_EQ(container->state(), NodeState::INITIALIZED);
    EXPECT_EQ(container->outstanding(), 0);
    container->finalize();
    EXPECT_EQ(container->state(), NodeState::COMPLETE);
}
