/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <stdexcept>

#include <dfms/discovery/discovery.hpp>
#include <dfms/error.hpp>

namespace dfms {

void LocalDiscovery::add(std::shared_ptr<ManagerInterface> const& manager) {
    DFMS_EXPECTS(manager != nullptr, "manager cannot be NULL", std::invalid_argument);
    std::lock_guard<std::mutex> lock(mutex_);
    DFMS_EXPECTS(
        managers_.emplace(manager->manager_id(), manager).second,
        "manager " + manager->manager_id() + " is already registered",
        std::invalid_argument
    );
}

std::shared_ptr<ManagerInterface> LocalDiscovery::resolve(ManagerID const& manager_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = managers_.find(manager_id);
    DFMS_EXPECTS(
        it != managers_.end(), "unknown manager " + manager_id, std::out_of_range
    );
    auto ret = it->second.lock();
    DFMS_EXPECTS(
        ret != nullptr, "manager " + manager_id + " no longer exists", std::out_of_range
    );
    return ret;
}

std::vector<ManagerID> LocalDiscovery::managers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ManagerID> ret;
    ret.reserve(managers_.size());
    for (auto const& [id, _] : managers_) {
        ret.push_back(id);
    }
    return ret;
}

}  // namespace dfms
