/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <thread>

#include <dfms/error.hpp>
#include <dfms/manager/listeners.hpp>

namespace dfms {

QueuedListener::QueuedListener(
    std::shared_ptr<Node> const& node, std::weak_ptr<detail::TaskQueue> queue
)
    : node_{node}, queue_{std::move(queue)}, id_{node->instance_id()} {}

void QueuedListener::deliver(Event const& event) {
    auto queue = queue_.lock();
    DFMS_EXPECTS(
        queue != nullptr, "event worker of " + id_ + " is gone", delivery_error
    );
    queue->push([node = node_, event]() {
        if (auto n = node.lock()) {
            n->handle_event(event);
        }
    });
}

RemoteListener::RemoteListener(
    NodeAddress target,
    std::shared_ptr<ManagerInterface> manager,
    std::weak_ptr<detail::TaskQueue> queue,
    std::weak_ptr<EventChannel> channel,
    std::size_t retries,
    Duration backoff,
    std::shared_ptr<Statistics> statistics
)
    : target_{std::move(target)},
      manager_{std::move(manager)},
      queue_{std::move(queue)},
      channel_{std::move(channel)},
      retries_{std::max<std::size_t>(retries, 1)},
      backoff_{backoff},
      statistics_{std::move(statistics)},
      id_{target_.instance_id + "@" + target_.manager_id} {
    DFMS_EXPECTS(manager_ != nullptr, "manager cannot be NULL", std::invalid_argument);
}

void RemoteListener::deliver(Event const& event) {
    auto queue = queue_.lock();
    DFMS_EXPECTS(
        queue != nullptr,
        "delivery queue of manager " + target_.manager_id + " is gone",
        delivery_error
    );
    queue->push([manager = manager_,
                 target = target_,
                 channel = channel_,
                 retries = retries_,
                 backoff = backoff_,
                 statistics = statistics_,
                 id = id_,
                 event]() {
        std::string reason;
        auto pause = backoff;
        for (std::size_t attempt = 1; attempt <= retries; ++attempt) {
            try {
                manager->deliver_event(target.instance_id, event);
                return;
            } catch (delivery_error const& e) {
                reason = e.what();
                statistics->add_stat("event-delivery-retries", 1);
                if (attempt < retries) {
                    std::this_thread::sleep_for(pause);
                    pause = std::min(pause * 2, Duration{0.05});
                }
            } catch (std::exception const& e) {
                reason = e.what();
                break;
            }
        }
        if (auto ch = channel.lock()) {
            ch->logger().warn(
                "delivery of ", event.str(), " to ", id, " failed: ", reason
            );
            ch->mark_broken(event.source, id);
        }
    });
}

}  // namespace dfms
