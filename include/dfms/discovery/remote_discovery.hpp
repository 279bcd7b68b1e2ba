/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include <dfms/discovery/address_book.hpp>
#include <dfms/discovery/discovery.hpp>
#include <dfms/rpc/manager_client.hpp>
#include <dfms/rpc/router.hpp>

namespace dfms {

/**
 * @brief Discovery of managers served by other ranks.
 *
 * Addresses come from an address book. Each resolved manager gets one cached
 * `rpc::ManagerClient`, all sharing the same router. The manager of this process,
 * once set, resolves to itself.
 */
class RemoteDiscovery final : public Discovery,
                              public std::enable_shared_from_this<RemoteDiscovery> {
  public:
    /**
     * @brief Construct a discovery.
     *
     * @param router The router the client stubs call through.
     * @param address_book Where manager addresses are published.
     * @param lookup_timeout How long `resolve()` waits for an address.
     */
    RemoteDiscovery(
        std::shared_ptr<rpc::Router> router,
        std::shared_ptr<AddressBook> address_book,
        Duration lookup_timeout
    );

    /**
     * @brief Sets the manager of this process and publishes its address.
     *
     * @param manager The local manager, not owned.
     */
    void set_local(std::shared_ptr<ManagerInterface> const& manager);

    [[nodiscard]] std::shared_ptr<ManagerInterface> resolve(ManagerID const& manager_id
    ) override;

    [[nodiscard]] std::vector<ManagerID> managers() const override;

  private:
    std::shared_ptr<rpc::Router> router_;
    std::shared_ptr<AddressBook> address_book_;
    Duration const lookup_timeout_;
    mutable std::mutex mutex_;
    ManagerID local_id_;
    std::weak_ptr<ManagerInterface> local_;
    std::map<ManagerID, std::shared_ptr<rpc::ManagerClient>> clients_;
};

}  // namespace dfms
