// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

#include "trellis/core/result.h"
#include "trellis/render_graph/graph_context.h"
#include "trellis/render_graph/node.h"
#include "trellis/renderer/world.h"

namespace trellis::render_graph {

// Producer must draw before consumer
struct Edge {
    std::string Producer;
    std::string Consumer;

    bool operator==(const Edge& other) const {
        return Producer == other.Producer && Consumer == other.Consumer;
    }
};

// A reader that consumed a shared resource without an edge path from its publisher
struct UndeclaredDependency {
    std::string Reader;
    std::string Resource;
    std::string Publisher;
};

/**
 * Set of named nodes plus ordering constraints between them.
 *
 * Nodes and edges may be added in any order; edges are only checked against
 * the node set when an execution order is computed. The order is a
 * topological sort (Kahn) with a FIFO ready queue seeded in lexicographic name
 * order and successors released in edge declaration order, so equal inputs
 * always give the same order.
 */
class RenderGraph {
public:
    RenderGraph() = default;

    RenderGraph(RenderGraph&&) = default;
    RenderGraph& operator=(RenderGraph&&) = default;
    RenderGraph(const RenderGraph&) = delete;
    RenderGraph& operator=(const RenderGraph&) = delete;

    // Insert or replace the node stored under `name`
    void AddNode(const std::string& name, RenderNodeWrapper node);

    // Record that `producer` draws before `consumer`. Identical edges are kept once.
    void AddEdge(const std::string& producer, const std::string& consumer);

    // Execution order, or UnknownNode / CycleDetected
    core::Result<std::vector<std::string>> OrderNodes();

    core::Result<void> Validate();

    // Draw every node once in execution order; the first failure ends the frame
    core::Result<void> Render(renderer::RenderContext& ctx, renderer::World world);

    // Resize every node, edges play no part; returns the first failure after visiting all nodes
    core::Result<void> Resize(glm::uvec2 extent);

    size_t NodeCount() const { return nodes_.size(); }
    bool HasNode(std::string_view name) const;
    std::vector<std::string> NodeNames() const;
    const std::vector<Edge>& Edges() const { return edges_; }
    std::optional<NodeState> StateOf(std::string_view name) const;

    // "a -> b -> c", or the ordering error message
    std::string DescribeOrder();

    RenderGraphContext& Context() { return context_; }
    const RenderGraphContext& Context() const { return context_; }

    const std::vector<UndeclaredDependency>& UndeclaredDependencies() const { return undeclared_; }

private:
    void AuditAccesses();
    bool IsAncestor(const std::string& ancestor, const std::string& node) const;
    // IsAncestor memoized per (ancestor, node); valid until the next AddEdge
    bool IsAncestorCached(const std::string& ancestor, const std::string& node);

    std::map<std::string, RenderNodeWrapper, std::less<>> nodes_;
    std::vector<Edge> edges_;
    RenderGraphContext context_;
    std::optional<std::vector<std::string>> cachedOrder_;
    std::map<std::pair<std::string, std::string>, bool> ancestry_;

    std::set<std::pair<std::string, std::string>> reported_;
    std::vector<UndeclaredDependency> undeclared_;
};

} // namespace trellis::render_graph
