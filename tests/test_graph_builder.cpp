/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <dfms/error.hpp>
#include <dfms/graph/graph_builder.hpp>

using namespace dfms;
using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

namespace dfms {
// Lets gtest print edges in failure messages.
void PrintTo(Edge const& e, std::ostream* os) {
    *os << e.from << " -> " << e.to << " (" << e.kind << ")";
}
}  // namespace dfms

namespace {

std::vector<ManagerID> const two_managers{"m1", "m2"};

bool has_edge(PhysicalGraph const& g, Edge const& e) {
    return std::ranges::find(g.edges(), e) != g.edges().end();
}

}  // namespace

TEST(GraphBuilder, InstanceIds) {
    auto single = StageSpec::data("a");
    auto wide = StageSpec::data("b").with_copies(3);
    EXPECT_EQ(GraphBuilder::instance_id("s", single, 0), "s/a");
    EXPECT_EQ(GraphBuilder::instance_id("s", wide, 0), "s/b#0");
    EXPECT_EQ(GraphBuilder::instance_id("s", wide, 2), "s/b#2");
}

TEST(GraphBuilder, LinearPipeline) {
    PipelineSpec pipeline;
    pipeline.add(StageSpec::data("in"))
        .add(StageSpec::consumer("grep", "grep", {"in"}, {{"substring", "a"}}))
        .add(StageSpec::consumer("sort", "sort", {"grep"}));
    auto const g = GraphBuilder{}.build(pipeline, "s", two_managers);

    EXPECT_EQ(g.session(), "s");
    ASSERT_EQ(g.nodes().size(), 3);
    EXPECT_THAT(g.edges(), ElementsAre(
        Edge{"s/in", "s/grep", EdgeKind::PRODUCER},
        Edge{"s/grep", "s/sort", EdgeKind::PRODUCER}
    ));
    EXPECT_THAT(g.roots(), ElementsAre("s/in"));
    EXPECT_THAT(g.leaves(), ElementsAre("s/sort"));

    auto const& grep = g.node("s/grep");
    EXPECT_EQ(grep.kind, NodeKind::CONSUMER);
    EXPECT_EQ(grep.application, "grep");
    EXPECT_EQ(grep.params.at("substring"), "a");
    EXPECT_EQ(grep.num_inputs, 1);
    EXPECT_FALSE(g.node("s/in").num_inputs.has_value());
    EXPECT_THROW(static_cast<void>(g.node("s/nope")), unknown_node);
}

TEST(GraphBuilder, RoundRobinPlacement) {
    PipelineSpec pipeline;
    pipeline.add(StageSpec::data("a").with_copies(3))
        .add(StageSpec::data("b"));
    auto const g = GraphBuilder{}.build(pipeline, "s", two_managers);
    EXPECT_EQ(g.manager_of("s/a#0"), "m1");
    EXPECT_EQ(g.manager_of("s/a#1"), "m2");
    EXPECT_EQ(g.manager_of("s/a#2"), "m1");
    EXPECT_EQ(g.manager_of("s/b"), "m2");
    EXPECT_THAT(g.managers(), ElementsAre("m1", "m2"));
    EXPECT_EQ(g.nodes_on("m1").size(), 2);
}

TEST(GraphBuilder, PlacementHint) {
    PipelineSpec pipeline;
    pipeline.add(StageSpec::data("a").on("m2")).add(StageSpec::data("b"));
    auto const g = GraphBuilder{}.build(pipeline, "s", two_managers);
    EXPECT_EQ(g.manager_of("s/a"), "m2");
    // Hinted stages do not advance the rotation.
    EXPECT_EQ(g.manager_of("s/b"), "m1");
    EXPECT_THAT(g.managers(), ElementsAre("m1", "m2"));

    PipelineSpec bad;
    bad.add(StageSpec::data("a").on("m9"));
    EXPECT_THROW(
        static_cast<void>(GraphBuilder{}.build(bad, "s", two_managers)),
        graph_construction_error
    );
}

TEST(GraphBuilder, FanOutAndFanIn) {
    PipelineSpec pipeline;
    pipeline.add(StageSpec::data("in"))
        .add(StageSpec::consumer("work", "crc", {"in"}).with_copies(3))
        .add(StageSpec::consumer("join", "copy", {"work"}));
    auto const g = GraphBuilder{}.build(pipeline, "s", two_managers);

    for (std::size_t i = 0; i < 3; ++i) {
        auto const w = "s/work#" + std::to_string(i);
        EXPECT_TRUE(has_edge(g, Edge{"s/in", w, EdgeKind::PRODUCER}));
        EXPECT_TRUE(has_edge(g, Edge{w, "s/join", EdgeKind::PRODUCER}));
        EXPECT_EQ(g.node(w).num_inputs, 1);
    }
    EXPECT_EQ(g.node("s/join").num_inputs, 3);
    EXPECT_EQ(g.edges().size(), 6);
}

TEST(GraphBuilder, EqualWidthStagesArePairedOneToOne) {
    PipelineSpec pipeline;
    pipeline.add(StageSpec::data("in").with_copies(2))
        .add(StageSpec::consumer("work", "crc", {"in"}).with_copies(2));
    auto const g = GraphBuilder{}.build(pipeline, "s", two_managers);
    EXPECT_THAT(g.edges(), UnorderedElementsAre(
        Edge{"s/in#0", "s/work#0", EdgeKind::PRODUCER},
        Edge{"s/in#1", "s/work#1", EdgeKind::PRODUCER}
    ));
    EXPECT_EQ(g.node("s/work#1").num_inputs, 1);
}

TEST(GraphBuilder, Containers) {
    PipelineSpec pipeline;
    pipeline.add(StageSpec::data("c1"))
        .add(StageSpec::data("c2").with_copies(2))
        .add(StageSpec::container("all", {"c1", "c2"}))
        .add(StageSpec::consumer("sum", "sum_checksums", {"all"}));
    auto const g = GraphBuilder{}.build(pipeline, "s", two_managers);

    EXPECT_TRUE(has_edge(g, Edge{"s/all", "s/c1", EdgeKind::CHILD}));
    EXPECT_TRUE(has_edge(g, Edge{"s/all", "s/c2#1", EdgeKind::CHILD}));
    EXPECT_EQ(g.node("s/all").num_inputs, 3);
    EXPECT_EQ(g.node("s/all").kind, NodeKind::CONTAINER);
    // Containers are neither roots nor fed by their children.
    EXPECT_THAT(g.roots(), UnorderedElementsAre("s/c1", "s/c2#0", "s/c2#1"));
    EXPECT_THAT(g.leaves(), ElementsAre("s/sum"));
}

TEST(GraphBuilder, EmptyContainerIsNotARoot) {
    PipelineSpec pipeline;
    pipeline.add(StageSpec::container("empty", {}));
    auto const g = GraphBuilder{}.build(pipeline, "s", two_managers);
    EXPECT_TRUE(g.roots().empty());
    EXPECT_EQ(g.node("s/empty").num_inputs, 0);
}

TEST(GraphBuilder, ValidationErrors) {
    auto expect_invalid = [](PipelineSpec const& p) {
        EXPECT_THROW(
            static_cast<void>(GraphBuilder{}.build(p, "s", two_managers)),
            graph_construction_error
        );
    };
    expect_invalid(PipelineSpec{{StageSpec::data("a"), StageSpec::data("a")}});
    expect_invalid(PipelineSpec{{StageSpec::data("")}});
    expect_invalid(PipelineSpec{{StageSpec::consumer("b", "crc", {"missing"})}});
    expect_invalid(PipelineSpec{{StageSpec::consumer("b", "crc", {"b"})}});
    expect_invalid(PipelineSpec{{StageSpec::consumer("b", "crc", {})}});
    expect_invalid(PipelineSpec{{StageSpec::data("a"), StageSpec::consumer("b", "", {"a"})}}
    );
    expect_invalid(PipelineSpec{
        {StageSpec::data("a"), StageSpec::consumer("b", "crc", {"a", "a"})}
    });
    expect_invalid(PipelineSpec{{StageSpec::data("a").with_copies(0)}});

    auto data_with_inputs = StageSpec::data("x");
    data_with_inputs.inputs = {"a"};
    expect_invalid(PipelineSpec{{StageSpec::data("a"), data_with_inputs}});

    auto container_with_inputs = StageSpec::container("x", {});
    container_with_inputs.inputs = {"a"};
    expect_invalid(PipelineSpec{{StageSpec::data("a"), container_with_inputs}});

    PipelineSpec ok{{StageSpec::data("a")}};
    EXPECT_THROW(
        static_cast<void>(GraphBuilder{}.build(ok, "s", {})), graph_construction_error
    );
    EXPECT_THROW(
        static_cast<void>(GraphBuilder{}.build(ok, "", two_managers)),
        graph_construction_error
    );
    EXPECT_THROW(GraphBuilder{nullptr}, std::invalid_argument);
}

TEST(GraphBuilder, ProducerCycle) {
    PipelineSpec pipeline{
        {StageSpec::consumer("a", "copy", {"b"}), StageSpec::consumer("b", "copy", {"a"})}
    };
    EXPECT_THROW(
        static_cast<void>(GraphBuilder{}.build(pipeline, "s", two_managers)),
        graph_construction_error
    );
}

// A container consumed by one of its own children waits on itself.
TEST(GraphBuilder, ContainerCycle) {
    PipelineSpec pipeline{
        {StageSpec::data("a"),
         StageSpec::container("box", {"a", "c"}),
         StageSpec::consumer("c", "copy", {"box"})}
    };
    EXPECT_THROW(
        static_cast<void>(GraphBuilder{}.build(pipeline, "s", two_managers)),
        graph_construction_error
    );
}

TEST(PhysicalGraph, EdgeChecks) {
    PhysicalGraph g{"s"};
    g.add_node(NodeDescriptor{.object_id = "a", .instance_id = "s/a"}, "m1");
    g.add_node(NodeDescriptor{.object_id = "b", .instance_id = "s/b"}, "m1");
    EXPECT_THROW(
        g.add_node(NodeDescriptor{.object_id = "a", .instance_id = "s/a"}, "m2"),
        graph_construction_error
    );
    g.add_edge(Edge{"s/a", "s/b", EdgeKind::PRODUCER});
    EXPECT_THROW(g.add_edge(Edge{"s/a", "s/b", EdgeKind::PRODUCER}), graph_construction_error);
    EXPECT_THROW(g.add_edge(Edge{"s/a", "s/a", EdgeKind::PRODUCER}), graph_construction_error);
    EXPECT_THROW(g.add_edge(Edge{"s/a", "s/x", EdgeKind::PRODUCER}), graph_construction_error);
    g.add_edge(Edge{"s/b", "s/a", EdgeKind::PRODUCER});
    EXPECT_THROW(g.check_acyclic(), graph_construction_error);
    EXPECT_THAT(g.str(), ::testing::HasSubstr("s/a -> s/b (PRODUCER)"));
}
