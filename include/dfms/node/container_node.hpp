/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>

#include <dfms/node/node.hpp>

namespace dfms {

/**
 * @brief A node whose completion is the AND-join of its children.
 *
 * The container counts outstanding children. It completes exactly once, when the
 * last child completes, in whatever order and from whatever threads the children
 * complete. A failing child fails the container right away. A container holds no
 * data of its own.
 *
 * The child set must be closed before the container can complete. A container
 * constructed with a number of children is closed from the start. Otherwise the
 * caller closes it with `seal()` once every child has been added.
 */
class ContainerNode final : public Node {
  public:
    /**
     * @brief Construct a container.
     *
     * @param identity The identifiers of the node.
     * @param channel The channel of the node's session.
     * @param num_children The number of children the container will have. When
     * given, the outstanding counter starts at this value so that children completing
     * while others are still being added cannot complete the container early. When
     * not given, every `add_child()` adds one to the counter and the container stays
     * open until `seal()`.
     */
    ContainerNode(
        NodeIdentity identity,
        std::shared_ptr<EventChannel> channel,
        std::optional<std::size_t> num_children = std::nullopt
    );

    using NodeRef::write;

    [[nodiscard]] bool is_container() const override {
        return true;
    }

    [[nodiscard]] std::vector<std::shared_ptr<NodeRef>> children() const override;

    /**
     * @brief Containers are not writable.
     *
     * @throws dfms::invalid_state_transition always.
     */
    std::size_t write(std::span<std::uint8_t const> data) override;

    /**
     * @brief Registers a child hosted in this process and subscribes to it.
     *
     * A child that is already COMPLETE counts right away, one in ERROR fails the
     * container.
     *
     * @param child The child.
     *
     * @throws dfms::duplicate_consumer If `child` is already a child.
     * @throws dfms::invalid_state_transition If the container is terminal, sealed, or
     * already has all of its declared children.
     */
    void add_child(std::shared_ptr<Node> const& child);

    /**
     * @brief Registers a child, typically a proxy of a node in another process.
     *
     * The caller is responsible for subscribing the container to the child's events,
     * after registering it. The child's state is not queried.
     *
     * @param child The child.
     *
     * @throws dfms::duplicate_consumer If `child` is already a child.
     * @throws dfms::invalid_state_transition If the container is terminal, sealed, or
     * already has all of its declared children.
     */
    void add_remote_child(std::shared_ptr<NodeRef> const& child);

    /**
     * @brief Closes the child set.
     *
     * Completes the container if every child added so far already completed. A
     * container without children does not complete on its own. Sealing twice, or
     * sealing a container constructed with a number of children, has no effect.
     */
    void seal();

    /**
     * @brief Whether the child set is closed.
     *
     * @return True once sealed or when the number of children was declared.
     */
    [[nodiscard]] bool sealed() const;

    /**
     * @brief Counts a COMPLETE child or fails on an ERROR child.
     *
     * Repeated events of the same child are ignored.
     *
     * @param event The event of a child.
     */
    void handle_event(Event const& event) override;

    /**
     * @brief Number of children that have not completed yet.
     *
     * An open container counts one more, for the missing `seal()`.
     *
     * @return The outstanding counter.
     */
    [[nodiscard]] std::int64_t outstanding() const noexcept {
        return outstanding_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::string str() const override;

  private:
    void register_child(std::shared_ptr<NodeRef> const& child);

    std::optional<std::size_t> const num_children_;
    mutable std::mutex children_mutex_;
    std::vector<std::weak_ptr<NodeRef>> children_;
    std::vector<InstanceID> child_ids_;
    std::set<InstanceID> seen_;
    bool sealed_;
    std::atomic<std::int64_t> outstanding_;
};

}  // namespace dfms
