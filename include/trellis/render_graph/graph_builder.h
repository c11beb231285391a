// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <memory>
#include <string>
#include <utility>

#include "trellis/core/result.h"
#include "trellis/render_graph/node.h"

namespace trellis::renderer {
class Renderer;
}

namespace trellis::render_graph {

/**
 * Fluent front end for wiring a graph. Nodes are set up as soon as they are
 * added, so Setup runs in the order nodes are registered:
 *
 *   renderer.Graph()
 *       .Emplace<MainPass>("main")
 *       .Emplace<CompositePass>("composite")
 *       .AddEdge("main", "composite");
 */
class GraphBuilder {
public:
    explicit GraphBuilder(renderer::Renderer& renderer) : renderer_(renderer) {}

    GraphBuilder& AddNode(const std::string& name, std::unique_ptr<RenderNode> node);

    template<typename T, typename... Args>
    GraphBuilder& Emplace(const std::string& name, Args&&... args) {
        return AddNode(name, std::make_unique<T>(std::forward<Args>(args)...));
    }

    GraphBuilder& AddEdge(const std::string& producer, const std::string& consumer);

    core::Result<void> Validate();

private:
    renderer::Renderer& renderer_;
};

} // namespace trellis::render_graph
