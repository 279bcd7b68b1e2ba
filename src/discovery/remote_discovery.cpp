/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <stdexcept>

#include <dfms/discovery/remote_discovery.hpp>
#include <dfms/error.hpp>

namespace dfms {

RemoteDiscovery::RemoteDiscovery(
    std::shared_ptr<rpc::Router> router,
    std::shared_ptr<AddressBook> address_book,
    Duration lookup_timeout
)
    : router_{std::move(router)},
      address_book_{std::move(address_book)},
      lookup_timeout_{lookup_timeout} {
    DFMS_EXPECTS(router_ != nullptr, "the router cannot be NULL");
    DFMS_EXPECTS(address_book_ != nullptr, "the address book cannot be NULL");
}

void RemoteDiscovery::set_local(std::shared_ptr<ManagerInterface> const& manager) {
    DFMS_EXPECTS(manager != nullptr, "manager cannot be NULL", std::invalid_argument);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        local_id_ = manager->manager_id();
        local_ = manager;
    }
    address_book_->publish(manager->manager_id(), router_->comm()->rank());
}

std::shared_ptr<ManagerInterface> RemoteDiscovery::resolve(ManagerID const& manager_id
) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (manager_id == local_id_) {
            auto ret = local_.lock();
            DFMS_EXPECTS(
                ret != nullptr,
                "manager " + manager_id + " no longer exists",
                std::out_of_range
            );
            return ret;
        }
        auto it = clients_.find(manager_id);
        if (it != clients_.end()) {
            return it->second;
        }
    }
    // Not under the lock, the lookup may wait for the address to appear.
    auto const rank = address_book_->lookup(manager_id, lookup_timeout_);
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = clients_.try_emplace(manager_id);
    if (inserted) {
        it->second = std::make_shared<rpc::ManagerClient>(
            router_, rank, manager_id, weak_from_this()
        );
    }
    return it->second;
}

std::vector<ManagerID> RemoteDiscovery::managers() const {
    std::vector<ManagerID> ret;
    for (auto const& [id, _] : address_book_->entries()) {
        ret.push_back(id);
    }
    return ret;
}

}  // namespace dfms
