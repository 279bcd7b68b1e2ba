/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include <dfms/node/node_ref.hpp>
#include <dfms/node/types.hpp>

namespace dfms {

/**
 * @brief What a Node Manager needs to instantiate one node.
 */
struct NodeDescriptor {
    ObjectID object_id;  ///< Pipeline-level identifier.
    InstanceID instance_id;  ///< Unique instance identifier.
    NodeKind kind{NodeKind::DATA};  ///< Flavor of the node.
    StorageKind storage{StorageKind::MEMORY};  ///< Backend of the byte buffer.
    std::optional<std::size_t> expected_size{};  ///< Auto-finalize size, if any.
    std::string application{};  ///< Application name, consumers only.
    std::unordered_map<std::string, std::string> params{};  ///< Per-node options.

    /// @brief Number of producers (consumers) or children (containers), if known.
    std::optional<std::size_t> num_inputs{};
};

/// @brief Kind of a graph edge.
enum class EdgeKind : std::uint8_t {
    PRODUCER,  ///< `from` produces, `to` consumes.
    CHILD,  ///< `from` is a container, `to` is one of its children.
};

/**
 * @brief A directed edge of a physical graph.
 */
struct Edge {
    InstanceID from;  ///< Producer or container.
    InstanceID to;  ///< Consumer or child.
    EdgeKind kind{EdgeKind::PRODUCER};  ///< Kind of edge.

    /// @brief The node that publishes events along this edge.
    [[nodiscard]] InstanceID const& publisher() const noexcept {
        return kind == EdgeKind::PRODUCER ? from : to;
    }

    /// @brief The node that receives events along this edge.
    [[nodiscard]] InstanceID const& receiver() const noexcept {
        return kind == EdgeKind::PRODUCER ? to : from;
    }

    bool operator==(Edge const&) const = default;
};

/// @brief Where a node lives.
struct NodeAddress {
    InstanceID instance_id;  ///< The node.
    ManagerID manager_id;  ///< The manager hosting it.

    bool operator==(NodeAddress const&) const = default;
};

/// @brief Snapshot of a node, as returned by `ManagerInterface::node_info()`.
struct NodeInfo {
    NodeAddress address;  ///< The node.
    NodeKind kind{NodeKind::DATA};  ///< Flavor of the node.
    NodeState state{NodeState::INITIALIZED};  ///< Current state.
};

/// @brief Outcome of tearing down a session on one manager.
enum class ShutdownStatus : std::int32_t {
    CLEAN = 0,  ///< Every node was idle or terminal.
    FORCED = 1,  ///< At least one node was mid-write.
    UNKNOWN_SESSION = 2,  ///< Nothing to tear down.
};

/// @brief Name of an edge kind.
char const* to_string(EdgeKind kind) noexcept;

/// @brief Name of a shutdown status.
char const* to_string(ShutdownStatus status) noexcept;

inline std::ostream& operator<<(std::ostream& os, EdgeKind kind) {
    return os << to_string(kind);
}

inline std::ostream& operator<<(std::ostream& os, ShutdownStatus status) {
    return os << to_string(status);
}

/**
 * @brief The surface of a Node Manager, local or remote.
 *
 * Implemented by `NodeManager` in the hosting process and by `rpc::ManagerClient`
 * in every other process. The `node_*` operations act on one hosted node and are
 * what `RemoteNode` proxies forward to.
 */
class ManagerInterface {
  public:
    virtual ~ManagerInterface() noexcept = default;

    /**
     * @brief Identifier of the manager.
     *
     * @return The manager id.
     */
    [[nodiscard]] virtual ManagerID const& manager_id() const noexcept = 0;

    /**
     * @brief Reserves room for nodes of a session.
     *
     * @param session The session.
     * @param num_nodes Number of nodes to reserve.
     * @return False if the capacity would be exceeded, nothing is reserved then.
     */
    virtual bool reserve(SessionID const& session, std::size_t num_nodes) = 0;

    /**
     * @brief Drops the unused reservation of a session.
     *
     * @param session The session.
     */
    virtual void release(SessionID const& session) = 0;

    /**
     * @brief Instantiates a node.
     *
     * @param descriptor The node to create.
     * @param session The session the node belongs to.
     * @return The instance id of the created node.
     *
     * @throws dfms::resource_unavailable If no reserved or free slot is left.
     * @throws std::invalid_argument If the instance id is already in use.
     */
    virtual InstanceID register_node(
        NodeDescriptor const& descriptor, SessionID const& session
    ) = 0;

    /**
     * @brief Wires the endpoints of an edge that this manager hosts.
     *
     * The receiving endpoint registers the publisher, the publishing endpoint
     * subscribes the receiver. When both endpoints are hosted here, both happen, the
     * receiving side first.
     *
     * @param session The session.
     * @param edge The edge.
     * @param from_manager Manager hosting `edge.from`.
     * @param to_manager Manager hosting `edge.to`.
     *
     * @throws dfms::unknown_node If a hosted endpoint does not exist.
     * @throws dfms::duplicate_consumer If the edge is already wired.
     */
    virtual void link(
        SessionID const& session,
        Edge const& edge,
        ManagerID const& from_manager,
        ManagerID const& to_manager
    ) = 0;

    /**
     * @brief Resolves a live node.
     *
     * @param instance_id The node.
     * @return A reference to the node, or to a proxy of it.
     *
     * @throws dfms::unknown_node If the node is not live on this manager.
     */
    [[nodiscard]] virtual std::shared_ptr<NodeRef> lookup(InstanceID const& instance_id
    ) = 0;

    /**
     * @brief Tears down a session, expiring and destroying its nodes.
     *
     * @param session The session.
     * @return The teardown status.
     */
    virtual ShutdownStatus shutdown_session(SessionID const& session) = 0;

    /**
     * @brief Hands an event to a hosted node.
     *
     * The node handles the event asynchronously.
     *
     * @param target The receiving node.
     * @param event The event.
     *
     * @throws dfms::unknown_node If `target` is not live on this manager.
     */
    virtual void deliver_event(InstanceID const& target, Event const& event) = 0;

    /// @brief Snapshot of a hosted node.
    [[nodiscard]] virtual NodeInfo node_info(InstanceID const& id) = 0;

    /// @brief Derived value of a hosted node.
    [[nodiscard]] virtual std::uint32_t node_checksum(InstanceID const& id) = 0;

    /// @brief Number of bytes in a hosted node.
    [[nodiscard]] virtual std::size_t node_size(InstanceID const& id) = 0;

    /// @brief Writes to a hosted node, see `NodeRef::write()`.
    virtual std::size_t node_write(
        InstanceID const& id, std::span<std::uint8_t const> data
    ) = 0;

    /// @brief Finalizes a hosted node.
    virtual void node_finalize(InstanceID const& id) = 0;

    /// @brief Fails a hosted node.
    virtual void node_fail(InstanceID const& id, std::string const& cause) = 0;

    /// @brief Opens a read handle on a hosted node.
    [[nodiscard]] virtual ReadHandle node_open(InstanceID const& id) = 0;

    /// @brief Reads through a handle of a hosted node.
    [[nodiscard]] virtual std::vector<std::uint8_t> node_read(
        InstanceID const& id, ReadHandle handle, std::size_t max_bytes
    ) = 0;

    /// @brief Closes a handle of a hosted node.
    virtual void node_close(InstanceID const& id, ReadHandle handle) = 0;

    /// @brief Addresses of the children of a hosted container.
    [[nodiscard]] virtual std::vector<NodeAddress> node_children(InstanceID const& id
    ) = 0;
};

}  // namespace dfms
