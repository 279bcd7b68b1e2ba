/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <memory>
#include <string>

#include <dfms/manager/manager_interface.hpp>
#include <dfms/node/event_channel.hpp>
#include <dfms/node/node.hpp>
#include <dfms/statistics.hpp>
#include <dfms/task_queue.hpp>
#include <dfms/utils.hpp>

namespace dfms {

/**
 * @brief Delivers events to a node of the same manager through the manager's event
 * worker.
 *
 * The node handles the event on the worker thread, not in the publisher's thread.
 */
class QueuedListener final : public EventListener {
  public:
    /**
     * @brief Construct a listener.
     *
     * @param node The receiving node, not owned.
     * @param queue The event worker of the hosting manager, not owned.
     */
    QueuedListener(
        std::shared_ptr<Node> const& node, std::weak_ptr<detail::TaskQueue> queue
    );

    [[nodiscard]] std::string const& listener_id() const noexcept override {
        return id_;
    }

    /**
     * @brief Enqueues the event.
     *
     * @param event The event.
     *
     * @throws dfms::delivery_error If the event worker is gone.
     */
    void deliver(Event const& event) override;

  private:
    std::weak_ptr<Node> node_;
    std::weak_ptr<detail::TaskQueue> queue_;
    std::string const id_;
};

/**
 * @brief Delivers events to a node hosted by another manager.
 *
 * `deliver()` only enqueues onto the delivery queue of the destination manager, so
 * the publisher never waits on the remote call. On the queue, a `delivery_error`
 * is retried up to `retries` times in total, pausing `backoff` before the first
 * retry and twice as long before each next one. Any other error breaks the edge at
 * once. A broken edge is reported to the publisher's channel.
 */
class RemoteListener final : public EventListener {
  public:
    /**
     * @brief Construct a listener.
     *
     * @param target The receiving node.
     * @param manager The manager hosting `target`.
     * @param queue The delivery queue of that manager, not owned.
     * @param channel The publisher's channel, not owned.
     * @param retries Number of delivery attempts.
     * @param backoff The pause before the first retry.
     * @param statistics The statistics to record retries in.
     */
    RemoteListener(
        NodeAddress target,
        std::shared_ptr<ManagerInterface> manager,
        std::weak_ptr<detail::TaskQueue> queue,
        std::weak_ptr<EventChannel> channel,
        std::size_t retries,
        Duration backoff,
        std::shared_ptr<Statistics> statistics = Statistics::disabled()
    );

    [[nodiscard]] std::string const& listener_id() const noexcept override {
        return id_;
    }

    /**
     * @brief Enqueues the delivery of the event.
     *
     * @param event The event.
     *
     * @throws dfms::delivery_error If the delivery queue is gone.
     */
    void deliver(Event const& event) override;

  private:
    NodeAddress const target_;
    std::shared_ptr<ManagerInterface> manager_;
    std::weak_ptr<detail::TaskQueue> queue_;
    std::weak_ptr<EventChannel> channel_;
    std::size_t const retries_;
    Duration const backoff_;
    std::shared_ptr<Statistics> statistics_;
    std::string const id_;
};

}  // namespace dfms
