/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <stdexcept>

#include <dfms/error.hpp>
#include <dfms/manager/remote_node.hpp>

namespace dfms {

RemoteNode::RemoteNode(
    std::shared_ptr<ManagerInterface> manager,
    NodeAddress address,
    std::weak_ptr<Discovery> discovery
)
    : manager_{std::move(manager)},
      address_{std::move(address)},
      discovery_{std::move(discovery)} {
    DFMS_EXPECTS(manager_ != nullptr, "manager cannot be NULL", std::invalid_argument);
}

NodeState RemoteNode::state() const {
    return manager_->node_info(address_.instance_id).state;
}

std::uint32_t RemoteNode::checksum() const {
    return manager_->node_checksum(address_.instance_id);
}

std::size_t RemoteNode::size() const {
    return manager_->node_size(address_.instance_id);
}

bool RemoteNode::is_container() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_container_.has_value()) {
        is_container_ =
            manager_->node_info(address_.instance_id).kind == NodeKind::CONTAINER;
    }
    return *is_container_;
}

std::vector<std::shared_ptr<NodeRef>> RemoteNode::children() const {
    auto const addresses = manager_->node_children(address_.instance_id);
    auto discovery = discovery_.lock();
    std::vector<std::shared_ptr<NodeRef>> ret;
    ret.reserve(addresses.size());
    for (auto const& addr : addresses) {
        if (addr.manager_id == address_.manager_id) {
            ret.push_back(std::make_shared<RemoteNode>(manager_, addr, discovery_));
            continue;
        }
        DFMS_EXPECTS(
            discovery != nullptr,
            "cannot resolve manager " + addr.manager_id + " of " + addr.instance_id,
            std::out_of_range
        );
        ret.push_back(std::make_shared<RemoteNode>(
            discovery->resolve(addr.manager_id), addr, discovery_
        ));
    }
    return ret;
}

std::size_t RemoteNode::write(std::span<std::uint8_t const> data) {
    return manager_->node_write(address_.instance_id, data);
}

void RemoteNode::finalize() {
    manager_->node_finalize(address_.instance_id);
}

void RemoteNode::fail(std::string const& cause) {
    manager_->node_fail(address_.instance_id, cause);
}

ReadHandle RemoteNode::open() {
    return manager_->node_open(address_.instance_id);
}

std::vector<std::uint8_t> RemoteNode::read(ReadHandle handle, std::size_t max_bytes) {
    return manager_->node_read(address_.instance_id, handle, max_bytes);
}

void RemoteNode::close(ReadHandle handle) {
    manager_->node_close(address_.instance_id, handle);
}

}  // namespace dfms
