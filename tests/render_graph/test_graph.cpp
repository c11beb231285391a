// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <trellis/backend/headless_backend.h>
#include <trellis/render_graph/graph.h>
#include <trellis/renderer/render_context.h>

#include <algorithm>
#include <random>

#include "../support/test_nodes.h"

using namespace trellis;
using namespace trellis::render_graph;
using trellis::test::IndexOf;

namespace {

struct GraphFixture {
    backend::HeadlessBackend backend;
    renderer::RenderContext ctx{backend};
    RenderGraph graph;
    std::shared_ptr<test::CallLog> log = std::make_shared<test::CallLog>();

    void Add(const std::string& name) {
        graph.AddNode(name, test::MakeRecordingNode(ctx, graph.Context(), name, log));
    }
};

std::vector<std::string> sorted(std::vector<std::string> names) {
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace

TEST_CASE("Graph without edges orders every node", "[render_graph][graph]") {
    GraphFixture f;

    SECTION("Empty graph") {
        auto order = f.graph.OrderNodes();
        REQUIRE(order.IsOk());
        REQUIRE(order.Value().empty());
    }

    SECTION("Isolated nodes") {
        for (const char* name : {"shadow", "gbuffer", "bloom", "tonemap", "ui"}) {
            f.Add(name);
        }

        auto order = f.graph.OrderNodes();
        REQUIRE(order.IsOk());
        REQUIRE(order.Value().size() == f.graph.NodeCount());
        REQUIRE(sorted(order.Value()) == sorted(f.graph.NodeNames()));
    }
}

TEST_CASE("Edges to unknown nodes are structural errors", "[render_graph][graph]") {
    GraphFixture f;
    f.Add("main");

    SECTION("Unknown consumer") {
        f.graph.AddEdge("main", "composite");

        auto order = f.graph.OrderNodes();
        REQUIRE(order.IsErr());
        REQUIRE(order.GetError().Kind == core::ErrorKind::UnknownNode);
        REQUIRE(order.GetError().Subject == std::optional<std::string>("composite"));
        REQUIRE_THAT(order.GetError().Message, Catch::Matchers::ContainsSubstring("'composite'"));
    }

    SECTION("Unknown producer") {
        f.graph.AddEdge("shadow", "main");

        auto order = f.graph.OrderNodes();
        REQUIRE(order.IsErr());
        REQUIRE(order.GetError().Subject == std::optional<std::string>("shadow"));
    }

    SECTION("Edges may precede their nodes") {
        f.graph.AddEdge("main", "composite");
        f.Add("composite");

        REQUIRE(f.graph.Validate().IsOk());
    }
}

TEST_CASE("Cycles are structural errors", "[render_graph][graph]") {
    GraphFixture f;
    f.Add("a");
    f.Add("b");
    f.Add("c");

    SECTION("Two-node cycle") {
        f.graph.AddEdge("a", "b");
        f.graph.AddEdge("b", "a");

        auto order = f.graph.OrderNodes();
        REQUIRE(order.IsErr());
        REQUIRE(order.GetError().Kind == core::ErrorKind::CycleDetected);
        REQUIRE_THAT(order.GetError().Message, Catch::Matchers::EndsWith("nodes: a, b"));
    }

    SECTION("Self edge") {
        f.graph.AddEdge("c", "c");

        auto order = f.graph.OrderNodes();
        REQUIRE(order.IsErr());
        REQUIRE(order.GetError().Kind == core::ErrorKind::CycleDetected);
        REQUIRE(order.GetError().Subject == std::optional<std::string>("c"));
    }

    SECTION("Validate reports the cycle too") {
        f.graph.AddEdge("a", "b");
        f.graph.AddEdge("b", "c");
        f.graph.AddEdge("c", "a");

        auto valid = f.graph.Validate();
        REQUIRE(valid.IsErr());
        REQUIRE(core::IsStructural(valid.GetError().Kind));
    }
}

TEST_CASE("Diamond dependencies are respected", "[render_graph][graph]") {
    GraphFixture f;
    for (const char* name : {"D", "C", "B", "A"}) {
        f.Add(name);
    }
    f.graph.AddEdge("A", "B");
    f.graph.AddEdge("A", "C");
    f.graph.AddEdge("B", "D");
    f.graph.AddEdge("C", "D");

    auto order = f.graph.OrderNodes();
    REQUIRE(order.IsOk());

    const auto& names = order.Value();
    REQUIRE(names.size() == 4);
    REQUIRE(IndexOf(names, "A") < IndexOf(names, "B"));
    REQUIRE(IndexOf(names, "A") < IndexOf(names, "C"));
    REQUIRE(IndexOf(names, "B") < IndexOf(names, "D"));
    REQUIRE(IndexOf(names, "C") < IndexOf(names, "D"));
}

TEST_CASE("Ordering is deterministic", "[render_graph][graph]") {
    GraphFixture f;

    SECTION("Ready nodes start in name order") {
        for (const char* name : {"zeta", "alpha", "mid"}) {
            f.Add(name);
        }
        REQUIRE(f.graph.OrderNodes().Value() == std::vector<std::string>{"alpha", "mid", "zeta"});
    }

    SECTION("Successors are released in edge declaration order") {
        for (const char* name : {"root", "x", "y", "z"}) {
            f.Add(name);
        }
        f.graph.AddEdge("root", "z");
        f.graph.AddEdge("root", "x");
        f.graph.AddEdge("root", "y");

        REQUIRE(f.graph.OrderNodes().Value() == std::vector<std::string>{"root", "z", "x", "y"});
        REQUIRE(f.graph.DescribeOrder() == "root -> z -> x -> y");
    }
}

TEST_CASE("Duplicate edges are recorded once", "[render_graph][graph]") {
    GraphFixture f;
    f.Add("main");
    f.Add("composite");

    f.graph.AddEdge("main", "composite");
    f.graph.AddEdge("main", "composite");

    REQUIRE(f.graph.Edges().size() == 1);
    REQUIRE(f.graph.OrderNodes().Value() == std::vector<std::string>{"main", "composite"});
}

TEST_CASE("Cached order is invalidated by changes", "[render_graph][graph]") {
    GraphFixture f;
    f.Add("b");
    f.Add("a");
    REQUIRE(f.graph.OrderNodes().Value() == std::vector<std::string>{"a", "b"});

    f.graph.AddEdge("b", "a");
    REQUIRE(f.graph.OrderNodes().Value() == std::vector<std::string>{"b", "a"});

    f.Add("c");
    REQUIRE(f.graph.OrderNodes().Value().size() == 3);

    f.graph.AddEdge("a", "missing");
    REQUIRE(f.graph.OrderNodes().IsErr());
    REQUIRE(f.graph.DescribeOrder().find("missing") != std::string::npos);
}

TEST_CASE("Random DAGs are ordered topologically", "[render_graph][graph]") {
    std::mt19937 rng(1234);

    for (int round = 0; round < 20; ++round) {
        GraphFixture f;
        const int count = 2 + static_cast<int>(rng() % 12);

        std::vector<std::string> names;
        for (int i = 0; i < count; ++i) {
            names.push_back("node" + std::to_string(i));
        }
        // Register in shuffled order; edges only go from lower to higher index
        auto registration = names;
        std::shuffle(registration.begin(), registration.end(), rng);
        for (const auto& name : registration) {
            f.Add(name);
        }
        for (int from = 0; from < count; ++from) {
            for (int to = from + 1; to < count; ++to) {
                if (rng() % 3 == 0) {
                    f.graph.AddEdge(names[from], names[to]);
                }
            }
        }

        auto order = f.graph.OrderNodes();
        REQUIRE(order.IsOk());
        REQUIRE(order.Value().size() == static_cast<size_t>(count));
        for (const auto& edge : f.graph.Edges()) {
            REQUIRE(IndexOf(order.Value(), edge.Producer) < IndexOf(order.Value(), edge.Consumer));
        }
    }
}

TEST_CASE("Nodes are replaced by name", "[render_graph][graph]") {
    GraphFixture f;
    f.Add("main");
    f.Add("main");

    REQUIRE(f.graph.NodeCount() == 1);
    REQUIRE(f.graph.HasNode("main"));
    REQUIRE_FALSE(f.graph.HasNode("composite"));
    REQUIRE(f.graph.StateOf("main") == std::optional<NodeState>(NodeState::Configured));
    REQUIRE_FALSE(f.graph.StateOf("composite").has_value());
}
