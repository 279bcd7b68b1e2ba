/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dfms/error.hpp>
#include <dfms/manager/remote_node.hpp>
#include <dfms/rpc/manager_client.hpp>

namespace dfms::rpc {

ManagerClient::ManagerClient(
    std::shared_ptr<Router> router,
    Rank rank,
    ManagerID manager_id,
    std::weak_ptr<Discovery> discovery
)
    : router_{std::move(router)},
      rank_{rank},
      manager_id_{std::move(manager_id)},
      discovery_{std::move(discovery)} {
    DFMS_EXPECTS(router_ != nullptr, "the router cannot be NULL");
}

std::vector<std::uint8_t> ManagerClient::call(Op op, Writer& args) {
    return router_->call(rank_, op, args.take());
}

bool ManagerClient::reserve(SessionID const& session, std::size_t num_nodes) {
    Writer args;
    args.string(session).u64(num_nodes);
    auto const reply = call(Op::RESERVE, args);
    return Reader{reply}.boolean();
}

void ManagerClient::release(SessionID const& session) {
    Writer args;
    args.string(session);
    call(Op::RELEASE, args);
}

InstanceID ManagerClient::register_node(
    NodeDescriptor const& descriptor, SessionID const& session
) {
    Writer args;
    args.descriptor(descriptor).string(session);
    auto const reply = call(Op::REGISTER_NODE, args);
    return Reader{reply}.string();
}

void ManagerClient::link(
    SessionID const& session,
    Edge const& edge,
    ManagerID const& from_manager,
    ManagerID const& to_manager
) {
    Writer args;
    args.string(session).edge(edge).string(from_manager).string(to_manager);
    call(Op::LINK, args);
}

std::shared_ptr<NodeRef> ManagerClient::lookup(InstanceID const& instance_id) {
    auto const info = node_info(instance_id);
    return std::make_shared<RemoteNode>(shared_from_this(), info.address, discovery_);
}

ShutdownStatus ManagerClient::shutdown_session(SessionID const& session) {
    Writer args;
    args.string(session);
    auto const reply = call(Op::SHUTDOWN_SESSION, args);
    return static_cast<ShutdownStatus>(Reader{reply}.i32());
}

void ManagerClient::deliver_event(InstanceID const& target, Event const& event) {
    Writer args;
    args.string(target).event(event);
    call(Op::DELIVER_EVENT, args);
}

NodeInfo ManagerClient::node_info(InstanceID const& id) {
    Writer args;
    args.string(id);
    auto const reply = call(Op::NODE_INFO, args);
    return Reader{reply}.info();
}

std::uint32_t ManagerClient::node_checksum(InstanceID const& id) {
    Writer args;
    args.string(id);
    auto const reply = call(Op::NODE_CHECKSUM, args);
    return Reader{reply}.u32();
}

std::size_t ManagerClient::node_size(InstanceID const& id) {
    Writer args;
    args.string(id);
    auto const reply = call(Op::NODE_SIZE, args);
    return Reader{reply}.u64();
}

std::size_t ManagerClient::node_write(
    InstanceID const& id, std::span<std::uint8_t const> data
) {
    Writer args;
    args.string(id).bytes(data);
    auto const reply = call(Op::NODE_WRITE, args);
    return Reader{reply}.u64();
}

void ManagerClient::node_finalize(InstanceID const& id) {
    Writer args;
    args.string(id);
    call(Op::NODE_FINALIZE, args);
}

void ManagerClient::node_fail(InstanceID const& id, std::string const& cause) {
    Writer args;
    args.string(id).string(cause);
    call(Op::NODE_FAIL, args);
}

ReadHandle ManagerClient::node_open(InstanceID const& id) {
    Writer args;
    args.string(id);
    auto const reply = call(Op::NODE_OPEN, args);
    return Reader{reply}.u64();
}

std::vector<std::uint8_t> ManagerClient::node_read(
    InstanceID const& id, ReadHandle handle, std::size_t max_bytes
) {
    Writer args;
    args.string(id).u64(handle).u64(max_bytes);
    auto const reply = call(Op::NODE_READ, args);
    return Reader{reply}.bytes();
}

void ManagerClient::node_close(InstanceID const& id, ReadHandle handle) {
    Writer args;
    args.string(id).u64(handle);
    call(Op::NODE_CLOSE, args);
}

std::vector<NodeAddress> ManagerClient::node_children(InstanceID const& id) {
    Writer args;
    args.string(id);
    auto const reply = call(Op::NODE_CHILDREN, args);
    Reader reader{reply};
    std::vector<NodeAddress> ret(reader.u64());
    for (auto& addr : ret) {
        addr = reader.address();
    }
    return ret;
}

}  // namespace dfms::rpc
