/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <dfms/communicator/communicator.hpp>
#include <dfms/node/types.hpp>
#include <dfms/statistics.hpp>

namespace dfms {

/**
 * @brief Receiver of events published on an `EventChannel`.
 */
class EventListener {
  public:
    virtual ~EventListener() noexcept = default;

    /**
     * @brief Identifier of the listener, unique per source on a channel.
     *
     * @return Usually the instance id of the listening node.
     */
    [[nodiscard]] virtual std::string const& listener_id() const noexcept = 0;

    /**
     * @brief Delivers an event.
     *
     * @param event The event.
     *
     * @throws dfms::delivery_error If the event cannot be delivered.
     */
    virtual void deliver(Event const& event) = 0;
};

/**
 * @brief Per-session delivery of node lifecycle events.
 *
 * Listeners subscribe to a source node. `publish()` hands the event to every listener
 * of the source in subscription order, in the publishing thread. A listener that
 * throws is logged and its edge marked broken, delivery to the other listeners goes
 * on.
 */
class EventChannel {
  public:
    /**
     * @brief A (source, listener) pair.
     */
    using Edge = std::pair<InstanceID, std::string>;

    /**
     * @brief Construct a channel.
     *
     * @param logger The logger, must outlive the channel.
     * @param statistics The statistics instance to use.
     */
    EventChannel(
        Communicator::Logger& logger,
        std::shared_ptr<Statistics> statistics = Statistics::disabled()
    );

    ~EventChannel() noexcept = default;

    EventChannel(EventChannel const&) = delete;
    EventChannel& operator=(EventChannel const&) = delete;

    /**
     * @brief Subscribes a listener to the events of a source.
     *
     * @param source The publishing node.
     * @param listener The listener.
     *
     * @throws dfms::duplicate_consumer If a listener with the same id is already
     * subscribed to `source`.
     */
    void subscribe(InstanceID const& source, std::shared_ptr<EventListener> listener);

    /**
     * @brief Whether a listener is subscribed to a source.
     *
     * @param source The publishing node.
     * @param listener_id The listener id.
     * @return True if subscribed.
     */
    [[nodiscard]] bool is_subscribed(
        InstanceID const& source, std::string const& listener_id
    ) const;

    /**
     * @brief Delivers an event to every listener of its source.
     *
     * @param event The event.
     * @return The number of listeners the event was handed to successfully.
     */
    std::size_t publish(Event const& event);

    /**
     * @brief Delivers an event to a single listener of its source.
     *
     * Used to replay a terminal event to a listener that subscribed after the source
     * had already published it. Failures are handled as in `publish()`.
     *
     * @param listener The listener.
     * @param event The event.
     * @return True if the event was handed to the listener.
     */
    bool deliver(EventListener& listener, Event const& event);

    /**
     * @brief Marks an edge as broken, no further events are delivered on it.
     *
     * @param source The publishing node.
     * @param listener_id The listener id.
     */
    void mark_broken(InstanceID const& source, std::string const& listener_id);

    /**
     * @brief The broken edges.
     *
     * @return Every (source, listener) marked broken, ordered.
     */
    [[nodiscard]] std::vector<Edge> broken_edges() const;

    /**
     * @brief Number of listeners subscribed to a source (including broken ones).
     *
     * @param source The publishing node.
     * @return The number of listeners.
     */
    [[nodiscard]] std::size_t num_subscribers(InstanceID const& source) const;

    /**
     * @brief Drops every subscription of a source.
     *
     * @param source The publishing node.
     */
    void unsubscribe_all(InstanceID const& source);

    /**
     * @brief The logger of the channel.
     *
     * @return The logger.
     */
    [[nodiscard]] Communicator::Logger& logger() const noexcept {
        return logger_;
    }

    /**
     * @brief The statistics of the channel.
     *
     * @return The statistics.
     */
    [[nodiscard]] std::shared_ptr<Statistics> const& statistics() const noexcept {
        return statistics_;
    }

  private:
    Communicator::Logger& logger_;
    std::shared_ptr<Statistics> statistics_;
    mutable std::mutex mutex_;
    std::map<InstanceID, std::vector<std::shared_ptr<EventListener>>> listeners_;
    std::set<Edge> broken_;
};

}  // namespace dfms
