/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dfms/error.hpp>
#include <dfms/rpc/manager_server.hpp>

namespace dfms::rpc {

ManagerServer::ManagerServer(
    std::shared_ptr<ManagerInterface> manager, std::shared_ptr<Router> router
)
    : manager_{std::move(manager)}, router_{std::move(router)} {
    DFMS_EXPECTS(manager_ != nullptr, "the manager cannot be NULL");
    DFMS_EXPECTS(router_ != nullptr, "the router cannot be NULL");
    router_->set_handler([this](Rank, Op op, Reader& args) {
        return dispatch(op, args);
    });
}

ManagerServer::~ManagerServer() noexcept {
    router_->set_handler(nullptr);
}

std::vector<std::uint8_t> ManagerServer::dispatch(Op op, Reader& args) {
    Writer ret;
    switch (op) {
    case Op::RESERVE:
        {
            auto session = args.string();
            ret.boolean(manager_->reserve(session, args.u64()));
            break;
        }
    case Op::RELEASE:
        manager_->release(args.string());
        break;
    case Op::REGISTER_NODE:
        {
            auto descriptor = args.descriptor();
            ret.string(manager_->register_node(descriptor, args.string()));
            break;
        }
    case Op::LINK:
        {
            auto session = args.string();
            auto edge = args.edge();
            auto from_manager = args.string();
            manager_->link(session, edge, from_manager, args.string());
            break;
        }
    case Op::SHUTDOWN_SESSION:
        ret.i32(static_cast<std::int32_t>(manager_->shutdown_session(args.string())));
        break;
    case Op::DELIVER_EVENT:
        {
            auto target = args.string();
            manager_->deliver_event(target, args.event());
            break;
        }
    case Op::NODE_INFO:
        ret.info(manager_->node_info(args.string()));
        break;
    case Op::NODE_CHECKSUM:
        ret.u32(manager_->node_checksum(args.string()));
        break;
    case Op::NODE_SIZE:
        ret.u64(manager_->node_size(args.string()));
        break;
    case Op::NODE_WRITE:
        {
            auto id = args.string();
            auto const data = args.bytes();
            ret.u64(manager_->node_write(id, data));
            break;
        }
    case Op::NODE_FINALIZE:
        manager_->node_finalize(args.string());
        break;
    case Op::NODE_FAIL:
        {
            auto id = args.string();
            manager_->node_fail(id, args.string());
            break;
        }
    case Op::NODE_OPEN:
        ret.u64(manager_->node_open(args.string()));
        break;
    case Op::NODE_READ:
        {
            auto id = args.string();
            auto handle = args.u64();
            ret.bytes(manager_->node_read(id, handle, args.u64()));
            break;
        }
    case Op::NODE_CLOSE:
        {
            auto id = args.string();
            manager_->node_close(id, args.u64());
            break;
        }
    case Op::NODE_CHILDREN:
        {
            auto const children = manager_->node_children(args.string());
            ret.u64(children.size());
            for (auto const& child : children) {
                ret.address(child);
            }
            break;
        }
    default:
        DFMS_FAIL(
            "unsupported operation " + std::to_string(static_cast<int>(op)),
            std::invalid_argument
        );
    }
    return ret.take();
}

}  // namespace dfms::rpc
