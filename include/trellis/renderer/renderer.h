// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <glm/glm.hpp>

#include "trellis/backend/render_backend.h"
#include "trellis/core/config.h"
#include "trellis/core/result.h"
#include "trellis/render_graph/graph.h"
#include "trellis/render_graph/graph_builder.h"
#include "trellis/renderer/render_context.h"
#include "trellis/renderer/world.h"

namespace trellis::renderer {

enum class FrameStatus {
    Presented,
    // The surface was out of date; the backend has been resized and the next frame retries
    Skipped,
};

const char* ToString(FrameStatus status);

/**
 * Owns the backend, the render context and the graph, and drives one frame
 * at a time through them.
 */
class Renderer {
public:
    explicit Renderer(std::unique_ptr<backend::RenderBackend> backend);

    // Renderer without a device: graphs can be wired, nothing can be created or drawn
    static Renderer Headless(glm::uvec2 extent = glm::uvec2(1280, 720));

    // Picks the backend named in the config
    static Renderer Create(const config::AppConfig& config);

    Renderer(Renderer&&) = default;
    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    render_graph::GraphBuilder Graph() { return render_graph::GraphBuilder(*this); }

    // Run the node's Setup and resolve its pipeline
    render_graph::RenderNodeWrapper SetupRenderNode(const std::string& name,
                                                    std::unique_ptr<render_graph::RenderNode> node);

    core::Result<FrameStatus> BeginDraw(World world);

    void Resize(glm::uvec2 extent);

    backend::RenderBackend& Backend() { return *backend_; }
    render_graph::RenderGraph& RenderGraphRef() { return graph_; }
    RenderContext& Context() { return context_; }
    uint64_t FrameIndex() const { return context_.FrameIndex(); }
    bool IsHeadless() const { return backend_->IsHeadless(); }

private:
    std::unique_ptr<backend::RenderBackend> backend_;
    RenderContext context_;
    render_graph::RenderGraph graph_;
};

} // namespace trellis::renderer
