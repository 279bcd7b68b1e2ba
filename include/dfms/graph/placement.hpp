/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <cstddef>
#include <vector>

#include <dfms/graph/pipeline.hpp>
#include <dfms/node/types.hpp>

namespace dfms {

/**
 * @brief Assigns node instances to managers.
 */
class PlacementPolicy {
  public:
    virtual ~PlacementPolicy() noexcept = default;

    /**
     * @brief Called once before the instances of a graph are placed.
     *
     * @param managers The available managers, never empty.
     */
    virtual void reset(std::vector<ManagerID> const& managers) = 0;

    /**
     * @brief Chooses the manager of one instance.
     *
     * @param stage The stage of the instance.
     * @param copy The index of the instance within its stage.
     * @param managers The available managers, never empty.
     * @return One of `managers`.
     *
     * @throws dfms::graph_construction_error If no manager fits.
     */
    virtual ManagerID place(
        StageSpec const& stage, std::size_t copy, std::vector<ManagerID> const& managers
    ) = 0;
};

/**
 * @brief Honors placement hints and assigns the other instances round-robin.
 */
class RoundRobinPlacement final : public PlacementPolicy {
  public:
    void reset(std::vector<ManagerID> const& managers) override;

    /// @copydoc PlacementPolicy::place
    ManagerID place(
        StageSpec const& stage, std::size_t copy, std::vector<ManagerID> const& managers
    ) override;

  private:
    std::size_t next_{0};
};

}  // namespace dfms
