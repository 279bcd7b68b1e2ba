/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>

#include <dfms/error.hpp>
#include <dfms/node/event_channel.hpp>

namespace dfms {

EventChannel::EventChannel(
    Communicator::Logger& logger, std::shared_ptr<Statistics> statistics
)
    : logger_{logger}, statistics_{std::move(statistics)} {
    DFMS_EXPECTS(statistics_ != nullptr, "the statistics pointer cannot be NULL");
}

void EventChannel::subscribe(
    InstanceID const& source, std::shared_ptr<EventListener> listener
) {
    DFMS_EXPECTS(listener != nullptr, "listener cannot be NULL", std::invalid_argument);
    std::lock_guard<std::mutex> lock(mutex_);
    auto& listeners = listeners_[source];
    DFMS_EXPECTS(
        std::ranges::none_of(
            listeners,
            [&](auto const& l) { return l->listener_id() == listener->listener_id(); }
        ),
        listener->listener_id() + " is already subscribed to " + source,
        duplicate_consumer
    );
    listeners.push_back(std::move(listener));
}

bool EventChannel::is_subscribed(
    InstanceID const& source, std::string const& listener_id
) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = listeners_.find(source);
    if (it == listeners_.end()) {
        return false;
    }
    return std::ranges::any_of(it->second, [&](auto const& l) {
        return l->listener_id() == listener_id;
    });
}

std::size_t EventChannel::publish(Event const& event) {
    std::vector<std::shared_ptr<EventListener>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = listeners_.find(event.source);
        if (it == listeners_.end()) {
            return 0;
        }
        for (auto const& l : it->second) {
            if (!broken_.contains({event.source, l->listener_id()})) {
                targets.push_back(l);
            }
        }
    }
    logger_.trace("EventChannel.publish() - ", event.str(), " to ", targets.size());
    std::size_t delivered = 0;
    for (auto const& l : targets) {
        if (deliver(*l, event)) {
            ++delivered;
        }
    }
    return delivered;
}

bool EventChannel::deliver(EventListener& listener, Event const& event) {
    try {
        listener.deliver(event);
    } catch (std::exception const& e) {
        logger_.warn(
            "failed to deliver ", event.str(), " to ", listener.listener_id(), ": ", e.what()
        );
        mark_broken(event.source, listener.listener_id());
        return false;
    }
    statistics_->add_stat("event-deliveries", 1);
    return true;
}

void EventChannel::mark_broken(InstanceID const& source, std::string const& listener_id) {
    bool inserted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inserted = broken_.insert({source, listener_id}).second;
    }
    if (inserted) {
        logger_.warn("edge ", source, " -> ", listener_id, " marked broken");
        statistics_->add_stat("broken-edges", 1);
    }
}

std::vector<EventChannel::Edge> EventChannel::broken_edges() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {broken_.begin(), broken_.end()};
}

std::size_t EventChannel::num_subscribers(InstanceID const& source) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = listeners_.find(source);
    return it == listeners_.end() ? 0 : it->second.size();
}

void EventChannel::unsubscribe_all(InstanceID const& source) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(source);
}

}  // namespace dfms
