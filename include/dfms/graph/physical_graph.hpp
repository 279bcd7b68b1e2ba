/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include <dfms/manager/manager_interface.hpp>

namespace dfms {

/**
 * @brief A physical dataflow graph: node descriptors, edges and placement.
 *
 * Every node is assigned to exactly one manager. The edge set is acyclic.
 */
class PhysicalGraph {
  public:
    /**
     * @brief Construct an empty graph.
     *
     * @param session The session the graph runs in.
     */
    explicit PhysicalGraph(SessionID session = {}) : session_{std::move(session)} {}

    /**
     * @brief Adds a node.
     *
     * @param descriptor The node.
     * @param manager_id The manager hosting it.
     *
     * @throws dfms::graph_construction_error If the instance id is already used.
     */
    void add_node(NodeDescriptor descriptor, ManagerID manager_id);

    /**
     * @brief Adds an edge between two nodes of the graph.
     *
     * @param edge The edge.
     *
     * @throws dfms::graph_construction_error If an endpoint is not in the graph, the
     * edge is a self loop or already present.
     */
    void add_edge(Edge edge);

    /**
     * @brief Checks that no node is its own ancestor.
     *
     * Edges are followed in the direction events travel, producer to consumer and
     * child to container.
     *
     * @throws dfms::graph_construction_error On a cycle, naming one node on it.
     */
    void check_acyclic() const;

    /// @brief The session.
    [[nodiscard]] SessionID const& session() const noexcept {
        return session_;
    }

    /// @brief The nodes, in insertion order.
    [[nodiscard]] std::vector<NodeDescriptor> const& nodes() const noexcept {
        return nodes_;
    }

    /// @brief The edges, in insertion order.
    [[nodiscard]] std::vector<Edge> const& edges() const noexcept {
        return edges_;
    }

    /**
     * @brief A node of the graph.
     *
     * @param instance_id The node.
     * @return Its descriptor.
     *
     * @throws dfms::unknown_node If the node is not in the graph.
     */
    [[nodiscard]] NodeDescriptor const& node(InstanceID const& instance_id) const;

    /**
     * @brief The manager hosting a node.
     *
     * @param instance_id The node.
     * @return The manager id.
     *
     * @throws dfms::unknown_node If the node is not in the graph.
     */
    [[nodiscard]] ManagerID const& manager_of(InstanceID const& instance_id) const;

    /// @brief The managers hosting at least one node, sorted.
    [[nodiscard]] std::vector<ManagerID> managers() const;

    /// @brief The nodes hosted by a manager, in insertion order.
    [[nodiscard]] std::vector<NodeDescriptor> nodes_on(ManagerID const& manager_id
    ) const;

    /**
     * @brief The nodes driven from outside the graph.
     *
     * These are the non-container nodes without a producer. Children of a
     * container are included, containers complete through their children.
     *
     * @return The root ids, in insertion order.
     */
    [[nodiscard]] std::vector<InstanceID> roots() const;

    /// @brief The nodes no other node consumes or contains.
    [[nodiscard]] std::vector<InstanceID> leaves() const;

    /// @brief Multi-line description of the graph.
    [[nodiscard]] std::string str() const;

  private:
    SessionID session_;
    std::vector<NodeDescriptor> nodes_;
    std::map<InstanceID, std::size_t> index_;
    std::map<InstanceID, ManagerID> placement_;
    std::vector<Edge> edges_;
};

}  // namespace dfms
