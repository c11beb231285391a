// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trellis/render_graph/graph_builder.h"

#include "trellis/renderer/renderer.h"

namespace trellis::render_graph {

GraphBuilder& GraphBuilder::AddNode(const std::string& name, std::unique_ptr<RenderNode> node) {
    auto wrapper = renderer_.SetupRenderNode(name, std::move(node));
    renderer_.RenderGraphRef().AddNode(name, std::move(wrapper));
    return *this;
}

GraphBuilder& GraphBuilder::AddEdge(const std::string& producer, const std::string& consumer) {
    renderer_.RenderGraphRef().AddEdge(producer, consumer);
    return *this;
}

core::Result<void> GraphBuilder::Validate() {
    return renderer_.RenderGraphRef().Validate();
}

} // namespace trellis::render_graph
