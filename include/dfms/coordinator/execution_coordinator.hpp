/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <dfms/communicator/communicator.hpp>
#include <dfms/graph/physical_graph.hpp>
#include <dfms/manager/manager_interface.hpp>
#include <dfms/utils.hpp>

namespace dfms {

/**
 * @brief Outcome of tearing down a session on every participating manager.
 */
struct ShutdownReport {
    /// @brief Status per manager: a `ShutdownStatus` value, or -1 if the manager threw.
    std::map<ManagerID, std::int32_t> status;

    /// @brief Error message per manager that threw.
    std::map<ManagerID, std::string> errors;

    /**
     * @brief Whether every manager tore down cleanly.
     *
     * @return True if every status is CLEAN.
     */
    [[nodiscard]] bool clean() const;
};

/**
 * @brief Submits physical graphs to Node Managers and tears them down.
 *
 * Submission is all-or-nothing. Every targeted manager first reserves room for its
 * nodes. If one declines, every reservation is released and nothing is created.
 * Only then are the nodes registered and the edges linked.
 */
class ExecutionCoordinator {
  public:
    /// @brief The managers a graph may be submitted to, by id.
    using Managers = std::map<ManagerID, std::shared_ptr<ManagerInterface>>;

    /**
     * @brief Construct a coordinator.
     *
     * @param comm The communicator, used for logging.
     */
    explicit ExecutionCoordinator(std::shared_ptr<Communicator> comm);

    /**
     * @brief Submits a graph.
     *
     * Managers reserve in manager-id order. A manager that declines or throws while
     * reserving aborts the submission. Nodes are then registered, and every edge is
     * linked on the manager of its receiving endpoint and then on the manager of its
     * publishing endpoint.
     *
     * @param pdg The graph, its session must not be live.
     * @param managers The managers, must contain every manager of the graph.
     * @return False if a manager declined, nothing was created then.
     *
     * @throws std::invalid_argument If the session is live or a manager is missing.
     * @throws The error of a failing registration or link. The session is torn down
     * on every targeted manager before rethrowing.
     */
    bool submit_pdg(PhysicalGraph const& pdg, Managers const& managers);

    /**
     * @brief Tears a session down on every participating manager.
     *
     * A manager that throws does not stop the teardown of the others. The session is
     * forgotten afterwards.
     *
     * @param session The session.
     * @return Per-manager status and errors, empty if the session is not live.
     */
    ShutdownReport shutdown(SessionID const& session);

    /**
     * @brief Fails every root of a session.
     *
     * Failure propagates downstream through the event channels.
     *
     * @param session The session.
     * @param cause Why the session is aborted.
     *
     * @throws std::out_of_range If the session is not live.
     */
    void abort(SessionID const& session, std::string const& cause);

    /**
     * @brief The nodes external data is written to.
     *
     * @param session The session.
     * @return References to the roots, see `PhysicalGraph::roots()`.
     *
     * @throws std::out_of_range If the session is not live.
     */
    [[nodiscard]] std::vector<std::shared_ptr<NodeRef>> roots(SessionID const& session);

    /**
     * @brief Resolves a node of a session.
     *
     * @param session The session.
     * @param instance_id The node.
     * @return A reference to the node.
     *
     * @throws std::out_of_range If the session is not live.
     * @throws dfms::unknown_node If the node is not part of the session.
     */
    [[nodiscard]] std::shared_ptr<NodeRef> lookup(
        SessionID const& session, InstanceID const& instance_id
    );

    /**
     * @brief Waits for every node of a session to reach a terminal state.
     *
     * @param session The session.
     * @param timeout The maximum time to wait.
     * @return True if every node is terminal, false on timeout.
     *
     * @throws std::out_of_range If the session is not live.
     */
    bool wait(SessionID const& session, Duration timeout);

    /**
     * @brief The graph of a live session.
     *
     * @param session The session.
     * @return The graph.
     *
     * @throws std::out_of_range If the session is not live.
     */
    [[nodiscard]] PhysicalGraph graph(SessionID const& session) const;

    /// @brief The live sessions.
    [[nodiscard]] std::vector<SessionID> sessions() const;

  private:
    struct Submission {
        PhysicalGraph pdg;
        Managers managers;
    };

    [[nodiscard]] Submission submission(SessionID const& session) const;
    void teardown(PhysicalGraph const& pdg, Managers const& managers);

    std::shared_ptr<Communicator> comm_;
    mutable std::mutex mutex_;
    std::map<SessionID, Submission> sessions_;
};

}  // namespace dfms
