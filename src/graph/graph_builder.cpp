/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <map>
#include <set>

#include <dfms/error.hpp>
#include <dfms/graph/graph_builder.hpp>

namespace dfms {

namespace {

void check_stage(
    StageSpec const& stage, std::map<std::string, StageSpec const*> const& stages
) {
    auto check_refs = [&](std::vector<std::string> const& refs, char const* what) {
        std::set<std::string> seen;
        for (auto const& ref : refs) {
            DFMS_EXPECTS(
                ref != stage.name,
                "stage " + stage.name + " cannot be its own " + what,
                graph_construction_error
            );
            DFMS_EXPECTS(
                stages.contains(ref),
                "stage " + stage.name + " references undeclared " + what + " " + ref,
                graph_construction_error
            );
            DFMS_EXPECTS(
                seen.insert(ref).second,
                "stage " + stage.name + " lists " + what + " " + ref + " twice",
                graph_construction_error
            );
        }
    };
    check_refs(stage.inputs, "input");
    check_refs(stage.children, "child");
    DFMS_EXPECTS(
        stage.copies > 0,
        "stage " + stage.name + " must have at least one copy",
        graph_construction_error
    );
    switch (stage.kind) {
    case NodeKind::CONSUMER:
        DFMS_EXPECTS(
            !stage.inputs.empty(),
            "consumer stage " + stage.name + " has no inputs",
            graph_construction_error
        );
        DFMS_EXPECTS(
            !stage.application.empty(),
            "consumer stage " + stage.name + " has no application",
            graph_construction_error
        );
        DFMS_EXPECTS(
            stage.children.empty(),
            "consumer stage " + stage.name + " cannot have children",
            graph_construction_error
        );
        break;
    case NodeKind::CONTAINER:
        DFMS_EXPECTS(
            stage.inputs.empty(),
            "container stage " + stage.name + " cannot have inputs",
            graph_construction_error
        );
        break;
    case NodeKind::DATA:
        DFMS_EXPECTS(
            stage.inputs.empty() && stage.children.empty(),
            "data stage " + stage.name + " cannot have inputs or children",
            graph_construction_error
        );
        break;
    }
}

}  // namespace

GraphBuilder::GraphBuilder(std::shared_ptr<PlacementPolicy> placement)
    : placement_{std::move(placement)} {
    DFMS_EXPECTS(
        placement_ != nullptr, "the placement policy cannot be NULL", std::invalid_argument
    );
}

InstanceID GraphBuilder::instance_id(
    SessionID const& session, StageSpec const& stage, std::size_t copy
) {
    auto ret = session + "/" + stage.name;
    if (stage.copies > 1) {
        ret += "#" + std::to_string(copy);
    }
    return ret;
}

PhysicalGraph GraphBuilder::build(
    PipelineSpec const& pipeline,
    SessionID const& session,
    std::vector<ManagerID> const& managers
) const {
    DFMS_EXPECTS(!managers.empty(), "no manager available", graph_construction_error);
    DFMS_EXPECTS(!session.empty(), "the session id cannot be empty", graph_construction_error);

    std::map<std::string, StageSpec const*> stages;
    for (auto const& stage : pipeline.stages()) {
        DFMS_EXPECTS(
            !stage.name.empty(), "a stage name cannot be empty", graph_construction_error
        );
        DFMS_EXPECTS(
            stages.emplace(stage.name, &stage).second,
            "duplicate stage " + stage.name,
            graph_construction_error
        );
    }
    for (auto const& stage : pipeline.stages()) {
        check_stage(stage, stages);
    }

    auto instances = [&](StageSpec const& stage) {
        std::vector<InstanceID> ret;
        for (std::size_t i = 0; i < stage.copies; ++i) {
            ret.push_back(instance_id(session, stage, i));
        }
        return ret;
    };

    PhysicalGraph ret{session};
    placement_->reset(managers);
    for (auto const& stage : pipeline.stages()) {
        // Number of producers, or children, of each instance.
        std::size_t num_inputs = 0;
        for (auto const& in : stage.inputs) {
            auto const width = stages.at(in)->copies;
            num_inputs += width == stage.copies ? 1 : width;
        }
        for (auto const& child : stage.children) {
            num_inputs += stages.at(child)->copies;
        }
        for (std::size_t i = 0; i < stage.copies; ++i) {
            NodeDescriptor desc;
            desc.object_id = stage.name;
            desc.instance_id = instance_id(session, stage, i);
            desc.kind = stage.kind;
            desc.storage = stage.storage;
            desc.expected_size = stage.expected_size;
            desc.application = stage.application;
            desc.params = stage.params;
            if (stage.kind != NodeKind::DATA) {
                desc.num_inputs = num_inputs;
            }
            ret.add_node(std::move(desc), placement_->place(stage, i, managers));
        }
    }
    for (auto const& stage : pipeline.stages()) {
        auto const targets = instances(stage);
        for (auto const& in : stage.inputs) {
            auto const sources = instances(*stages.at(in));
            for (std::size_t i = 0; i < targets.size(); ++i) {
                if (sources.size() == targets.size()) {
                    ret.add_edge(Edge{sources[i], targets[i], EdgeKind::PRODUCER});
                } else {
                    for (auto const& src : sources) {
                        ret.add_edge(Edge{src, targets[i], EdgeKind::PRODUCER});
                    }
                }
            }
        }
        for (auto const& child : stage.children) {
            for (auto const& container : targets) {
                for (auto const& c : instances(*stages.at(child))) {
                    ret.add_edge(Edge{container, c, EdgeKind::CHILD});
                }
            }
        }
    }
    ret.check_acyclic();
    return ret;
}

}  // namespace dfms
