// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <optional>

#include <glm/glm.hpp>

#include "trellis/render_graph/graph_context.h"
#include "trellis/render_graph/node.h"
#include "trellis/renderer/render_context.h"
#include "trellis/viewer/app.h"

namespace trellis::viewer {

// Name under which FractalPass publishes its output
constexpr const char* MAIN_OUTPUT = "main/output";

struct FullscreenQuad {
    backend::BufferHandle Vertices;
    backend::BufferHandle Indices;

    static FullscreenQuad Create(renderer::RenderContext& ctx);
};

struct FractalParams {
    glm::vec2 Center{-0.5f, 0.0f};
    float Zoom = 1.0f;
    float Time = 0.0f;
    glm::uvec2 Extent{0, 0};
    uint32_t MaxIterations = 256;
    uint32_t Padding = 0;
};

/**
 * Renders an animated Mandelbrot set into an off-screen texture and publishes
 * a sampler/texture descriptor set for it as "main/output". After a resize the
 * texture is recreated at the next draw and the entry is republished.
 */
class FractalPass : public render_graph::RenderNode {
public:
    render_graph::RenderNodeDescriptor Setup(renderer::RenderContext& ctx,
                                             render_graph::RenderGraphContext& graphCtx) override;

    core::Result<void> Draw(renderer::RenderContext& ctx,
                            render_graph::RenderNodeContext& nodeCtx,
                            render_graph::RenderGraphContext& graphCtx,
                            renderer::World world) override;

    core::Result<void> Resize(glm::uvec2 extent) override;

    const FractalParams& Params() const { return params_; }

private:
    void CreateOutput(renderer::RenderContext& ctx, glm::uvec2 extent);
    void ReleaseOutput(renderer::RenderContext& ctx);

    FullscreenQuad quad_;
    FractalParams params_;
    backend::BufferHandle paramsBuffer_;
    backend::DescriptorSetHandle paramsSet_;
    backend::DescriptorSetLayoutHandle outputLayout_;
    backend::SamplerHandle sampler_;
    backend::TextureHandle texture_;
    backend::DescriptorSetHandle outputSet_;
    std::optional<glm::uvec2> pendingExtent_;
};

// Samples "main/output" onto the surface
class CompositePass : public render_graph::RenderNode {
public:
    render_graph::RenderNodeDescriptor Setup(renderer::RenderContext& ctx,
                                             render_graph::RenderGraphContext& graphCtx) override;

    core::Result<void> Draw(renderer::RenderContext& ctx,
                            render_graph::RenderNodeContext& nodeCtx,
                            render_graph::RenderGraphContext& graphCtx,
                            renderer::World world) override;

private:
    FullscreenQuad quad_;
};

// Adds "main" and "composite" with the edge main -> composite
void RegisterFractalGraph(renderer::Renderer& renderer);

class FractalPlugin : public Plugin {
public:
    void Init(App& app) override { RegisterFractalGraph(app.GetRenderer()); }
};

} // namespace trellis::viewer
