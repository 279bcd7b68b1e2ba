/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <memory>
#include <string>
#include <vector>

#include <dfms/discovery/discovery.hpp>
#include <dfms/manager/manager_interface.hpp>
#include <dfms/rpc/router.hpp>

namespace dfms::rpc {

/**
 * @brief Client stub of a Node Manager in another process.
 *
 * Every operation is one blocking call through the router and raises the exception
 * type the remote manager raised. A call that times out raises `delivery_error`.
 */
class ManagerClient final : public ManagerInterface,
                            public std::enable_shared_from_this<ManagerClient> {
  public:
    /**
     * @brief Construct a stub.
     *
     * @param router The router to call through.
     * @param rank The rank serving the manager.
     * @param manager_id The id of the manager.
     * @param discovery Handed to the node proxies returned by `lookup()`.
     */
    ManagerClient(
        std::shared_ptr<Router> router,
        Rank rank,
        ManagerID manager_id,
        std::weak_ptr<Discovery> discovery = {}
    );

    [[nodiscard]] ManagerID const& manager_id() const noexcept override {
        return manager_id_;
    }

    /// @brief The rank serving the manager.
    [[nodiscard]] Rank rank() const noexcept {
        return rank_;
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

    /**
     * @brief Checks that the node is live and returns a proxy of it.
     *
     * @param instance_id The node.
     * @return A `RemoteNode`.
     *
     * @throws dfms::unknown_node If the node is not live on the remote manager.
     */
    [[nodiscard]] std::shared_ptr<NodeRef> lookup(InstanceID const& instance_id
    ) override;

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

  private:
    std::vector<std::uint8_t> call(Op op, Writer& args);

    std::shared_ptr<Router> router_;
    Rank const rank_;
    ManagerID const manager_id_;
    std::weak_ptr<Discovery> discovery_;
};

}  // namespace dfms::rpc
