/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <memory>
#include <string>
#include <vector>

#include <dfms/graph/physical_graph.hpp>
#include <dfms/graph/pipeline.hpp>
#include <dfms/graph/placement.hpp>

namespace dfms {

/**
 * @brief Translates a logical pipeline into a physical graph.
 *
 * A stage with `copies = n` becomes n instances with instance ids
 * `<session>/<name>` (n = 1) or `<session>/<name>#i`. An input stage as wide as its
 * consumer is wired one to one, any other input feeds every consumer instance. A
 * container lists every instance of each child stage.
 */
class GraphBuilder {
  public:
    /**
     * @brief Construct a builder.
     *
     * @param placement The placement policy.
     */
    explicit GraphBuilder(
        std::shared_ptr<PlacementPolicy> placement = std::make_shared<RoundRobinPlacement>()
    );

    /**
     * @brief Builds the physical graph of a pipeline.
     *
     * @param pipeline The logical pipeline.
     * @param session The session the graph runs in.
     * @param managers The available managers.
     * @return The graph.
     *
     * @throws dfms::graph_construction_error If the pipeline has duplicate stage
     * names, references an undeclared stage, has a stage reference itself, has a
     * cycle, has a consumer without inputs, has inputs or children on a stage of the
     * wrong kind, or if `managers` is empty.
     */
    [[nodiscard]] PhysicalGraph build(
        PipelineSpec const& pipeline,
        SessionID const& session,
        std::vector<ManagerID> const& managers
    ) const;

    /**
     * @brief The instance id of one copy of a stage.
     *
     * @param session The session.
     * @param stage The stage.
     * @param copy The copy index.
     * @return The instance id.
     */
    [[nodiscard]] static InstanceID instance_id(
        SessionID const& session, StageSpec const& stage, std::size_t copy
    );

  private:
    std::shared_ptr<PlacementPolicy> placement_;
};

}  // namespace dfms
