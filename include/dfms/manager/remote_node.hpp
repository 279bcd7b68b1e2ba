/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <dfms/discovery/discovery.hpp>
#include <dfms/manager/manager_interface.hpp>
#include <dfms/node/node_ref.hpp>

namespace dfms {

/**
 * @brief Proxy of a node hosted by a (possibly remote) manager.
 *
 * Every operation is forwarded to the hosting manager's `node_*` surface, so it
 * fails the way the manager call fails. Constructing a proxy does not contact the
 * manager.
 */
class RemoteNode final : public NodeRef {
  public:
    /**
     * @brief Construct a proxy.
     *
     * @param manager The hosting manager.
     * @param address The proxied node.
     * @param discovery Used to resolve the managers of children, may be empty.
     */
    RemoteNode(
        std::shared_ptr<ManagerInterface> manager,
        NodeAddress address,
        std::weak_ptr<Discovery> discovery = {}
    );

    using NodeRef::write;

    [[nodiscard]] InstanceID const& instance_id() const noexcept override {
        return address_.instance_id;
    }

    [[nodiscard]] ManagerID const& manager_id() const noexcept override {
        return address_.manager_id;
    }

    [[nodiscard]] NodeState state() const override;
    [[nodiscard]] std::uint32_t checksum() const override;
    [[nodiscard]] std::size_t size() const override;
    [[nodiscard]] bool is_container() const override;

    /**
     * @brief Proxies of the children of the proxied container.
     *
     * @return The children.
     *
     * @throws std::out_of_range If a child's manager cannot be resolved.
     */
    [[nodiscard]] std::vector<std::shared_ptr<NodeRef>> children() const override;

    std::size_t write(std::span<std::uint8_t const> data) override;
    void finalize() override;
    void fail(std::string const& cause) override;
    [[nodiscard]] ReadHandle open() override;
    [[nodiscard]] std::vector<std::uint8_t> read(
        ReadHandle handle, std::size_t max_bytes
    ) override;
    void close(ReadHandle handle) override;

    /**
     * @brief The hosting manager.
     *
     * @return The manager.
     */
    [[nodiscard]] std::shared_ptr<ManagerInterface> const& manager() const noexcept {
        return manager_;
    }

  private:
    std::shared_ptr<ManagerInterface> manager_;
    NodeAddress const address_;
    std::weak_ptr<Discovery> discovery_;
    mutable std::mutex mutex_;
    mutable std::optional<bool> is_container_;
};

}  // namespace dfms
