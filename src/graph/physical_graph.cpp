/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <sstream>

#include <dfms/error.hpp>
#include <dfms/graph/physical_graph.hpp>

namespace dfms {

void PhysicalGraph::add_node(NodeDescriptor descriptor, ManagerID manager_id) {
    DFMS_EXPECTS(
        !index_.contains(descriptor.instance_id),
        "duplicate node " + descriptor.instance_id,
        graph_construction_error
    );
    index_.emplace(descriptor.instance_id, nodes_.size());
    placement_.emplace(descriptor.instance_id, std::move(manager_id));
    nodes_.push_back(std::move(descriptor));
}

void PhysicalGraph::add_edge(Edge edge) {
    DFMS_EXPECTS(
        index_.contains(edge.from), "undeclared node " + edge.from, graph_construction_error
    );
    DFMS_EXPECTS(
        index_.contains(edge.to), "undeclared node " + edge.to, graph_construction_error
    );
    DFMS_EXPECTS(
        edge.from != edge.to,
        edge.from + " cannot be linked to itself",
        graph_construction_error
    );
    DFMS_EXPECTS(
        std::ranges::find(edges_, edge) == edges_.end(),
        "duplicate edge " + edge.from + " -> " + edge.to,
        graph_construction_error
    );
    edges_.push_back(std::move(edge));
}

void PhysicalGraph::check_acyclic() const {
    std::map<InstanceID, std::vector<InstanceID>> out;
    for (auto const& e : edges_) {
        out[e.publisher()].push_back(e.receiver());
    }
    enum class Mark { NONE, ACTIVE, DONE };
    std::map<InstanceID, Mark> marks;
    // Iterative DFS, a node met again while ACTIVE closes a cycle.
    for (auto const& root : nodes_) {
        if (marks[root.instance_id] != Mark::NONE) {
            continue;
        }
        std::vector<std::pair<InstanceID, std::size_t>> stack{{root.instance_id, 0}};
        marks[root.instance_id] = Mark::ACTIVE;
        while (!stack.empty()) {
            auto& [id, next] = stack.back();
            auto const& succ = out[id];
            if (next == succ.size()) {
                marks[id] = Mark::DONE;
                stack.pop_back();
                continue;
            }
            auto const child = succ[next++];
            auto& mark = marks[child];
            DFMS_EXPECTS(
                mark != Mark::ACTIVE,
                "cycle through " + child + " in session " + session_,
                graph_construction_error
            );
            if (mark == Mark::NONE) {
                mark = Mark::ACTIVE;
                stack.emplace_back(child, 0);
            }
        }
    }
}

NodeDescriptor const& PhysicalGraph::node(InstanceID const& instance_id) const {
    auto it = index_.find(instance_id);
    DFMS_EXPECTS(
        it != index_.end(), instance_id + " is not part of the graph", unknown_node
    );
    return nodes_[it->second];
}

ManagerID const& PhysicalGraph::manager_of(InstanceID const& instance_id) const {
    auto it = placement_.find(instance_id);
    DFMS_EXPECTS(
        it != placement_.end(), instance_id + " is not part of the graph", unknown_node
    );
    return it->second;
}

std::vector<ManagerID> PhysicalGraph::managers() const {
    std::set<ManagerID> ret;
    for (auto const& [_, m] : placement_) {
        ret.insert(m);
    }
    return {ret.begin(), ret.end()};
}

std::vector<NodeDescriptor> PhysicalGraph::nodes_on(ManagerID const& manager_id) const {
    std::vector<NodeDescriptor> ret;
    for (auto const& n : nodes_) {
        if (placement_.at(n.instance_id) == manager_id) {
            ret.push_back(n);
        }
    }
    return ret;
}

std::vector<InstanceID> PhysicalGraph::roots() const {
    std::set<InstanceID> fed;
    for (auto const& e : edges_) {
        if (e.kind == EdgeKind::PRODUCER) {
            fed.insert(e.to);
        }
    }
    std::vector<InstanceID> ret;
    for (auto const& n : nodes_) {
        if (n.kind != NodeKind::CONTAINER && !fed.contains(n.instance_id)) {
            ret.push_back(n.instance_id);
        }
    }
    return ret;
}

std::vector<InstanceID> PhysicalGraph::leaves() const {
    std::set<InstanceID> feeding;
    for (auto const& e : edges_) {
        feeding.insert(e.publisher());
    }
    std::vector<InstanceID> ret;
    for (auto const& n : nodes_) {
        if (!feeding.contains(n.instance_id)) {
            ret.push_back(n.instance_id);
        }
    }
    return ret;
}

std::string PhysicalGraph::str() const {
    std::stringstream ss;
    ss << "PhysicalGraph(session=" << session_ << ", nodes=" << nodes_.size()
       << ", edges=" << edges_.size() << ")\n";
    for (auto const& n : nodes_) {
        ss << "  " << n.instance_id << " [" << n.kind;
        if (!n.application.empty()) {
            ss << ":" << n.application;
        }
        ss << "] on " << placement_.at(n.instance_id) << "\n";
    }
    for (auto const& e : edges_) {
        ss << "  " << e.from << " -> " << e.to << " (" << e.kind << ")\n";
    }
    return ss.str();
}

}  // namespace dfms
