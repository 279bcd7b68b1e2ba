/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <memory>
#include <vector>

#include <dfms/manager/manager_interface.hpp>
#include <dfms/rpc/router.hpp>

namespace dfms::rpc {

/**
 * @brief Serves a Node Manager to the other processes.
 *
 * Installs itself as the router's request handler for its lifetime.
 */
class ManagerServer {
  public:
    /**
     * @brief Start serving.
     *
     * @param manager The served manager.
     * @param router The router receiving the requests.
     */
    ManagerServer(std::shared_ptr<ManagerInterface> manager, std::shared_ptr<Router> router);

    /// @brief Stops serving.
    ~ManagerServer() noexcept;

    ManagerServer(ManagerServer const&) = delete;
    ManagerServer& operator=(ManagerServer const&) = delete;

    /**
     * @brief Executes one request against the manager.
     *
     * @param op The operation.
     * @param args The arguments.
     * @return The reply payload.
     */
    std::vector<std::uint8_t> dispatch(Op op, Reader& args);

  private:
    std::shared_ptr<ManagerInterface> manager_;
    std::shared_ptr<Router> router_;
};

}  // namespace dfms::rpc
