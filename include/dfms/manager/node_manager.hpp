/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <dfms/app/application.hpp>
#include <dfms/communicator/communicator.hpp>
#include <dfms/config.hpp>
#include <dfms/discovery/discovery.hpp>
#include <dfms/manager/manager_interface.hpp>
#include <dfms/node/event_channel.hpp>
#include <dfms/node/node.hpp>
#include <dfms/statistics.hpp>
#include <dfms/task_queue.hpp>
#include <dfms/utils.hpp>

namespace dfms {

/**
 * @brief Hosts, creates and tears down the nodes of one process.
 *
 * Nodes are grouped by session. Each session has its own event channel, and
 * tearing a session down never touches the nodes of another session. The manager
 * exclusively owns its nodes, everything else holds non-owning references.
 *
 * Events for hosted nodes, from this manager or from another one, are handled on
 * the manager's event worker. Events for nodes hosted elsewhere go through one
 * delivery queue per destination manager.
 */
class NodeManager final : public ManagerInterface,
                          public std::enable_shared_from_this<NodeManager> {
  public:
    /**
     * @brief Construct a Node Manager.
     *
     * @param manager_id The id of the manager.
     * @param comm The communicator, used for logging.
     * @param options Configuration options, see `manager_capacity`,
     * `delivery_retries` and `delivery_backoff`. Also the defaults of every node's
     * options.
     * @param discovery Resolves the other managers.
     * @param registry The applications consumer nodes can run.
     * @param statistics The statistics instance to use.
     */
    NodeManager(
        ManagerID manager_id,
        std::shared_ptr<Communicator> comm,
        config::Options options,
        std::shared_ptr<Discovery> discovery,
        ApplicationRegistry registry = ApplicationRegistry::with_builtins(),
        std::shared_ptr<Statistics> statistics = Statistics::disabled()
    );

    ~NodeManager() noexcept override;

    NodeManager(NodeManager const&) = delete;
    NodeManager& operator=(NodeManager const&) = delete;

    [[nodiscard]] ManagerID const& manager_id() const noexcept override {
        return manager_id_;
    }

    bool reserve(SessionID const& session, std::size_t num_nodes) override;
    void release(SessionID const& session) override;
    InstanceID register_node(
        NodeDescriptor const& descriptor, SessionID const& session
    ) override;
    void link(
        SessionID const& session,
        Edge const& edge,
        ManagerID const& from_manager,
        ManagerID const& to_manager
    ) override;
    [[nodiscard]] std::shared_ptr<NodeRef> lookup(InstanceID const& instance_id
    ) override;

    /**
     * @brief Tears down a session.
     *
     * Every node is expired and destroyed, its storage released and its
     * subscriptions dropped. A node that cannot be expired is logged and makes the
     * teardown count as forced.
     *
     * @param session The session.
     * @return CLEAN, FORCED if a node was mid-write, UNKNOWN_SESSION if the session
     * does not exist.
     */
    ShutdownStatus shutdown_session(SessionID const& session) override;

    void deliver_event(InstanceID const& target, Event const& event) override;

    [[nodiscard]] NodeInfo node_info(InstanceID const& id) override;
    [[nodiscard]] std::uint32_t node_checksum(InstanceID const& id) override;
    [[nodiscard]] std::size_t node_size(InstanceID const& id) override;
    std::size_t node_write(
        InstanceID const& id, std::span<std::uint8_t const> data
    ) override;
    void node_finalize(InstanceID const& id) override;
    void node_fail(InstanceID const& id, std::string const& cause) override;
    [[nodiscard]] ReadHandle node_open(InstanceID const& id) override;
    [[nodiscard]] std::vector<std::uint8_t> node_read(
        InstanceID const& id, ReadHandle handle, std::size_t max_bytes
    ) override;
    void node_close(InstanceID const& id, ReadHandle handle) override;
    [[nodiscard]] std::vector<NodeAddress> node_children(InstanceID const& id
    ) override;

    /**
     * @brief A hosted node.
     *
     * @param instance_id The node.
     * @return The node.
     *
     * @throws dfms::unknown_node If the node is not live on this manager.
     */
    [[nodiscard]] std::shared_ptr<Node> node(InstanceID const& instance_id) const;

    /**
     * @brief The event channel of a session.
     *
     * @param session The session.
     * @return The channel.
     *
     * @throws std::out_of_range If the session does not exist.
     */
    [[nodiscard]] std::shared_ptr<EventChannel> channel(SessionID const& session) const;

    /// @brief Ids of the live sessions.
    [[nodiscard]] std::vector<SessionID> sessions() const;

    /// @brief Number of live nodes over all sessions.
    [[nodiscard]] std::size_t num_nodes() const;

    /// @brief Number of reserved, not yet used, slots over all sessions.
    [[nodiscard]] std::size_t num_reserved() const;

    /// @brief Maximum number of live plus reserved nodes, 0 means unlimited.
    [[nodiscard]] std::size_t capacity() const noexcept {
        return capacity_;
    }

    /**
     * @brief Waits until the event worker and every delivery queue are idle.
     */
    void flush();

    /// @brief The logger.
    [[nodiscard]] Communicator::Logger& logger() const noexcept {
        return comm_->logger();
    }

    /// @brief The statistics.
    [[nodiscard]] std::shared_ptr<Statistics> const& statistics() const noexcept {
        return statistics_;
    }

    /// @brief Description of the manager.
    [[nodiscard]] std::string str() const;

  private:
    struct Session {
        std::shared_ptr<EventChannel> channel;
        std::map<InstanceID, std::shared_ptr<Node>> nodes;
        std::vector<std::shared_ptr<NodeRef>> remote_refs;
        std::size_t reserved{0};
    };

    Session& get_or_create_session(SessionID const& session);
    std::size_t num_used() const;
    std::shared_ptr<Node> find_node(InstanceID const& instance_id) const;
    std::shared_ptr<Node> create_node(
        NodeDescriptor const& descriptor,
        SessionID const& session,
        std::shared_ptr<EventChannel> channel
    );
    std::shared_ptr<detail::TaskQueue> delivery_queue(ManagerID const& destination);

    ManagerID const manager_id_;
    std::shared_ptr<Communicator> comm_;
    config::Options options_;
    std::shared_ptr<Discovery> discovery_;
    ApplicationRegistry const registry_;
    std::shared_ptr<Statistics> statistics_;
    std::size_t const capacity_;
    std::size_t const delivery_retries_;
    Duration const delivery_backoff_;

    mutable std::mutex mutex_;
    std::map<SessionID, Session> sessions_;
    std::map<InstanceID, SessionID> index_;  ///< Node to session.

    // Declared last, the worker threads stop before the nodes are destroyed.
    std::map<ManagerID, std::shared_ptr<detail::TaskQueue>> delivery_queues_;
    std::shared_ptr<detail::TaskQueue> events_;
};

}  // namespace dfms
