/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include <dfms/manager/manager_interface.hpp>

namespace dfms {

/**
 * @brief Resolves a manager id to something that can be called.
 */
class Discovery {
  public:
    virtual ~Discovery() noexcept = default;

    /**
     * @brief Resolves a manager.
     *
     * @param manager_id The manager.
     * @return The manager, or a client stub of it.
     *
     * @throws std::out_of_range If the manager is not known.
     */
    [[nodiscard]] virtual std::shared_ptr<ManagerInterface> resolve(
        ManagerID const& manager_id
    ) = 0;

    /**
     * @brief The known manager ids, sorted.
     *
     * @return The ids.
     */
    [[nodiscard]] virtual std::vector<ManagerID> managers() const = 0;
};

/**
 * @brief Discovery of managers living in this process.
 *
 * Holds non-owning references, a destroyed manager no longer resolves.
 */
class LocalDiscovery final : public Discovery {
  public:
    LocalDiscovery() = default;

    /**
     * @brief Registers a manager under its id.
     *
     * @param manager The manager.
     *
     * @throws std::invalid_argument If the id is already registered.
     */
    void add(std::shared_ptr<ManagerInterface> const& manager);

    [[nodiscard]] std::shared_ptr<ManagerInterface> resolve(ManagerID const& manager_id
    ) override;

    [[nodiscard]] std::vector<ManagerID> managers() const override;

  private:
    mutable std::mutex mutex_;
    std::map<ManagerID, std::weak_ptr<ManagerInterface>> managers_;
};

}  // namespace dfms
