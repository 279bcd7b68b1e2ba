/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <sstream>
#include <stdexcept>

#include <dfms/error.hpp>
#include <dfms/manager/listeners.hpp>
#include <dfms/manager/node_manager.hpp>
#include <dfms/manager/remote_node.hpp>
#include <dfms/node/consumer_node.hpp>
#include <dfms/node/container_node.hpp>
#include <dfms/node/storage.hpp>

namespace dfms {

NodeManager::NodeManager(
    ManagerID manager_id,
    std::shared_ptr<Communicator> comm,
    config::Options options,
    std::shared_ptr<Discovery> discovery,
    ApplicationRegistry registry,
    std::shared_ptr<Statistics> statistics
)
    : manager_id_{std::move(manager_id)},
      comm_{std::move(comm)},
      options_{std::move(options)},
      discovery_{std::move(discovery)},
      registry_{std::move(registry)},
      statistics_{std::move(statistics)},
      capacity_{options_.get<std::size_t>(
          "manager_capacity", config::default_factory<std::size_t>(0)
      )},
      delivery_retries_{options_.get<std::size_t>(
          "delivery_retries", config::default_factory<std::size_t>(3)
      )},
      delivery_backoff_{options_.get<double>(
          "delivery_backoff", config::default_factory<double>(0.001)
      )} {
    DFMS_EXPECTS(comm_ != nullptr, "the communicator cannot be NULL");
    DFMS_EXPECTS(discovery_ != nullptr, "the discovery cannot be NULL");
    DFMS_EXPECTS(statistics_ != nullptr, "the statistics cannot be NULL");
    DFMS_EXPECTS(
        delivery_retries_ > 0, "delivery_retries must be positive", std::invalid_argument
    );
    DFMS_EXPECTS(
        delivery_backoff_.count() >= 0,
        "delivery_backoff cannot be negative",
        std::invalid_argument
    );
    events_ = std::make_shared<detail::TaskQueue>(
        comm_->logger(), "events@" + manager_id_
    );
    logger().debug("NodeManager(", manager_id_, ") capacity: ", capacity_);
}

NodeManager::~NodeManager() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!sessions_.empty()) {
        logger().debug(
            "NodeManager(", manager_id_, ") destroyed with ", sessions_.size(),
            " live sessions"
        );
    }
}

NodeManager::Session& NodeManager::get_or_create_session(SessionID const& session) {
    auto it = sessions_.find(session);
    if (it == sessions_.end()) {
        it = sessions_.emplace(session, Session{}).first;
        it->second.channel =
            std::make_shared<EventChannel>(comm_->logger(), statistics_);
    }
    return it->second;
}

std::size_t NodeManager::num_used() const {
    std::size_t ret = 0;
    for (auto const& [_, s] : sessions_) {
        ret += s.nodes.size() + s.reserved;
    }
    return ret;
}

bool NodeManager::reserve(SessionID const& session, std::size_t num_nodes) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto const used = num_used();
    if (capacity_ > 0 && used + num_nodes > capacity_) {
        logger().info(
            "NodeManager(", manager_id_, ") declines ", num_nodes, " nodes of ",
            session, ", ", used, " of ", capacity_, " slots in use"
        );
        return false;
    }
    get_or_create_session(session).reserved += num_nodes;
    logger().debug(
        "NodeManager(", manager_id_, ") reserved ", num_nodes, " nodes of ", session
    );
    return true;
}

void NodeManager::release(SessionID const& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session);
    if (it == sessions_.end()) {
        return;
    }
    logger().debug(
        "NodeManager(", manager_id_, ") released ", it->second.reserved, " slots of ",
        session
    );
    it->second.reserved = 0;
    if (it->second.nodes.empty()) {
        sessions_.erase(it);
    }
}

std::shared_ptr<Node> NodeManager::create_node(
    NodeDescriptor const& descriptor,
    SessionID const& session,
    std::shared_ptr<EventChannel> channel
) {
    NodeIdentity identity{
        descriptor.object_id, descriptor.instance_id, session, manager_id_
    };
    config::Options node_options{descriptor.params};
    node_options.insert_if_absent(options_.get_strings());
    // Nodes wired by a manager are never sealed, their input count must be known.
    DFMS_EXPECTS(
        descriptor.kind == NodeKind::DATA || descriptor.num_inputs.has_value(),
        std::string{to_string(descriptor.kind)} + " " + descriptor.instance_id
            + " does not declare its number of inputs",
        std::invalid_argument
    );

    switch (descriptor.kind) {
    case NodeKind::DATA:
        return std::make_shared<Node>(
            std::move(identity),
            make_storage(descriptor.storage, descriptor.instance_id, node_options),
            std::move(channel),
            descriptor.expected_size
        );
    case NodeKind::CONTAINER:
        return std::make_shared<ContainerNode>(
            std::move(identity), std::move(channel), descriptor.num_inputs
        );
    case NodeKind::CONSUMER:
        {
            auto app = registry_.create(descriptor.application, node_options);
            auto storage =
                make_storage(descriptor.storage, descriptor.instance_id, node_options);
            return std::make_shared<ConsumerNode>(
                std::move(identity),
                std::move(storage),
                std::move(app),
                std::move(channel),
                std::move(node_options),
                descriptor.expected_size,
                descriptor.num_inputs
            );
        }
    }
    DFMS_FAIL("unknown node kind", std::invalid_argument);
}

InstanceID NodeManager::register_node(
    NodeDescriptor const& descriptor, SessionID const& session
) {
    DFMS_EXPECTS(
        !descriptor.instance_id.empty(),
        "the instance id cannot be empty",
        std::invalid_argument
    );
    std::lock_guard<std::mutex> lock(mutex_);
    DFMS_EXPECTS(
        !index_.contains(descriptor.instance_id),
        descriptor.instance_id + " already exists on manager " + manager_id_,
        std::invalid_argument
    );
    auto& s = get_or_create_session(session);
    if (s.reserved == 0) {
        DFMS_EXPECTS(
            capacity_ == 0 || num_used() < capacity_,
            "manager " + manager_id_ + " has no free slot for "
                + descriptor.instance_id,
            resource_unavailable
        );
    }
    // Nothing is consumed if the node cannot be created.
    auto node = create_node(descriptor, session, s.channel);
    if (s.reserved > 0) {
        --s.reserved;
    }
    s.nodes.emplace(descriptor.instance_id, std::move(node));
    index_.emplace(descriptor.instance_id, session);
    logger().debug(
        "NodeManager(", manager_id_, ") registered ", to_string(descriptor.kind),
        " node ", descriptor.instance_id
    );
    return descriptor.instance_id;
}

std::shared_ptr<Node> NodeManager::find_node(InstanceID const& instance_id) const {
    auto it = index_.find(instance_id);
    DFMS_EXPECTS(
        it != index_.end(),
        instance_id + " is not live on manager " + manager_id_,
        unknown_node
    );
    return sessions_.at(it->second).nodes.at(instance_id);
}

std::shared_ptr<Node> NodeManager::node(InstanceID const& instance_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_node(instance_id);
}

std::shared_ptr<NodeRef> NodeManager::lookup(InstanceID const& instance_id) {
    return node(instance_id);
}

std::shared_ptr<detail::TaskQueue> NodeManager::delivery_queue(
    ManagerID const& destination
) {
    auto& ret = delivery_queues_[destination];
    if (ret == nullptr) {
        ret = std::make_shared<detail::TaskQueue>(
            comm_->logger(), manager_id_ + "->" + destination
        );
    }
    return ret;
}

void NodeManager::link(
    SessionID const& session,
    Edge const& edge,
    ManagerID const& from_manager,
    ManagerID const& to_manager
) {
    auto const& publisher_manager =
        edge.kind == EdgeKind::PRODUCER ? from_manager : to_manager;
    auto const& receiver_manager =
        edge.kind == EdgeKind::PRODUCER ? to_manager : from_manager;
    DFMS_EXPECTS(
        publisher_manager == manager_id_ || receiver_manager == manager_id_,
        "manager " + manager_id_ + " hosts no endpoint of " + edge.from + " -> "
            + edge.to,
        std::invalid_argument
    );

    std::shared_ptr<Node> publisher;
    std::shared_ptr<Node> receiver;
    std::shared_ptr<EventChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session);
        DFMS_EXPECTS(
            it != sessions_.end(),
            "unknown session " + session + " on manager " + manager_id_,
            unknown_node
        );
        channel = it->second.channel;
        auto get = [&](InstanceID const& id) {
            auto n = it->second.nodes.find(id);
            DFMS_EXPECTS(
                n != it->second.nodes.end(),
                id + " is not part of session " + session + " on manager "
                    + manager_id_,
                unknown_node
            );
            return n->second;
        };
        if (publisher_manager == manager_id_) {
            publisher = get(edge.publisher());
        }
        if (receiver_manager == manager_id_) {
            receiver = get(edge.receiver());
        }
    }

    // The receiving side first, so that a replayed terminal event finds its
    // publisher registered.
    if (receiver != nullptr) {
        std::shared_ptr<NodeRef> ref = publisher;
        if (ref == nullptr) {
            ref = std::make_shared<RemoteNode>(
                discovery_->resolve(publisher_manager),
                NodeAddress{edge.publisher(), publisher_manager},
                discovery_
            );
        }
        if (edge.kind == EdgeKind::PRODUCER) {
            receiver->add_producer(ref);
        } else {
            auto container = std::dynamic_pointer_cast<ContainerNode>(receiver);
            DFMS_EXPECTS(
                container != nullptr,
                receiver->instance_id() + " is not a container",
                std::invalid_argument
            );
            container->add_remote_child(ref);
        }
        if (publisher == nullptr) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = sessions_.find(session);
            if (it != sessions_.end()) {
                it->second.remote_refs.push_back(std::move(ref));
            }
        }
    }

    if (publisher != nullptr) {
        std::shared_ptr<EventListener> listener;
        if (receiver != nullptr) {
            listener = std::make_shared<QueuedListener>(receiver, events_);
        } else {
            std::shared_ptr<detail::TaskQueue> queue;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                queue = delivery_queue(receiver_manager);
            }
            listener = std::make_shared<RemoteListener>(
                NodeAddress{edge.receiver(), receiver_manager},
                discovery_->resolve(receiver_manager),
                queue,
                channel,
                delivery_retries_,
                delivery_backoff_,
                statistics_
            );
        }
        publisher->add_consumer(std::move(listener));
    }
    logger().debug(
        "NodeManager(", manager_id_, ") linked ", to_string(edge.kind), " edge ",
        edge.from, " -> ", edge.to
    );
}

ShutdownStatus NodeManager::shutdown_session(SessionID const& session) {
    Session s;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session);
        if (it == sessions_.end()) {
            logger().info(
                "NodeManager(", manager_id_, ") has no session ", session,
                " to tear down"
            );
            return ShutdownStatus::UNKNOWN_SESSION;
        }
        s = std::move(it->second);
        sessions_.erase(it);
        for (auto const& [id, _] : s.nodes) {
            index_.erase(id);
        }
    }
    std::size_t num_forced = 0;
    for (auto const& [id, node] : s.nodes) {
        try {
            if (node->expire()) {
                ++num_forced;
            }
        } catch (std::exception const& e) {
            logger().warn("cannot expire ", id, ": ", e.what());
            ++num_forced;
        }
        s.channel->unsubscribe_all(id);
    }
    logger().info(
        "NodeManager(", manager_id_, ") tore down session ", session, " (",
        s.nodes.size(), " nodes, ", num_forced, " forced)"
    );
    return num_forced > 0 ? ShutdownStatus::FORCED : ShutdownStatus::CLEAN;
}

void NodeManager::deliver_event(InstanceID const& target, Event const& event) {
    auto n = node(target);
    events_->push([node = std::weak_ptr<Node>{n}, event]() {
        if (auto locked = node.lock()) {
            locked->handle_event(event);
        }
    });
}

NodeInfo NodeManager::node_info(InstanceID const& id) {
    auto n = node(id);
    NodeKind kind = NodeKind::DATA;
    if (n->is_container()) {
        kind = NodeKind::CONTAINER;
    } else if (dynamic_cast<ConsumerNode*>(n.get()) != nullptr) {
        kind = NodeKind::CONSUMER;
    }
    return NodeInfo{NodeAddress{id, manager_id_}, kind, n->state()};
}

std::uint32_t NodeManager::node_checksum(InstanceID const& id) {
    return node(id)->checksum();
}

std::size_t NodeManager::node_size(InstanceID const& id) {
    return node(id)->size();
}

std::size_t NodeManager::node_write(
    InstanceID const& id, std::span<std::uint8_t const> data
) {
    return node(id)->write(data);
}

void NodeManager::node_finalize(InstanceID const& id) {
    node(id)->finalize();
}

void NodeManager::node_fail(InstanceID const& id, std::string const& cause) {
    node(id)->fail(cause);
}

ReadHandle NodeManager::node_open(InstanceID const& id) {
    return node(id)->open();
}

std::vector<std::uint8_t> NodeManager::node_read(
    InstanceID const& id, ReadHandle handle, std::size_t max_bytes
) {
    return node(id)->read(handle, max_bytes);
}

void NodeManager::node_close(InstanceID const& id, ReadHandle handle) {
    node(id)->close(handle);
}

std::vector<NodeAddress> NodeManager::node_children(InstanceID const& id) {
    std::vector<NodeAddress> ret;
    for (auto const& child : node(id)->children()) {
        ret.push_back(NodeAddress{child->instance_id(), child->manager_id()});
    }
    return ret;
}

std::shared_ptr<EventChannel> NodeManager::channel(SessionID const& session) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session);
    DFMS_EXPECTS(
        it != sessions_.end(),
        "unknown session " + session + " on manager " + manager_id_,
        std::out_of_range
    );
    return it->second.channel;
}

std::vector<SessionID> NodeManager::sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionID> ret;
    for (auto const& [id, _] : sessions_) {
        ret.push_back(id);
    }
    return ret;
}

std::size_t NodeManager::num_nodes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
}

std::size_t NodeManager::num_reserved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t ret = 0;
    for (auto const& [_, s] : sessions_) {
        ret += s.reserved;
    }
    return ret;
}

void NodeManager::flush() {
    events_->flush();
    std::vector<std::shared_ptr<detail::TaskQueue>> queues;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto const& [_, q] : delivery_queues_) {
            queues.push_back(q);
        }
    }
    for (auto& q : queues) {
        q->flush();
    }
    events_->flush();
}

std::string NodeManager::str() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    ss << "NodeManager(" << manager_id_ << ", sessions=" << sessions_.size()
       << ", nodes=" << index_.size() << ", capacity=" << capacity_ << ")";
    return ss.str();
}

}  // namespace dfms
