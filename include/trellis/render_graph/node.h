// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "trellis/backend/render_backend.h"
#include "trellis/core/result.h"
#include "trellis/renderer/world.h"

namespace trellis::renderer {
class RenderContext;
}

namespace trellis::render_graph {

class RenderGraphContext;

using backend::RenderTarget;

// What a node asks for when it is set up
struct RenderNodeDescriptor {
    backend::GraphicsShader Shader;
    std::vector<backend::DescriptorSetLayoutHandle> DescriptorSetLayouts;
    RenderTarget Target = RenderTarget::Surface();
};

/**
 * Resolved state of a node, built once from its descriptor. Draw receives it
 * mutably so a node with an off-screen target can swap the texture after a
 * resize; nothing else changes after setup.
 */
struct RenderNodeContext {
    std::string Name;
    backend::GraphicsShader Shader;
    backend::PipelineHandle Pipeline;
    std::vector<backend::DescriptorSetLayoutHandle> Layouts;
    RenderTarget Target = RenderTarget::Surface();

    // Point the node at a new texture of the same format as its current one
    core::Result<void> Retarget(const backend::TextureHandle& texture);
};

enum class NodeState {
    Uninitialized,
    Configured,
    Drawing,
    Resized,
};

const char* ToString(NodeState state);

/**
 * A unit of rendering work. Setup runs exactly once when the node is added to
 * the graph, Draw once per frame in dependency order, Resize whenever the
 * surface changes size (in no particular order relative to other nodes).
 */
class RenderNode {
public:
    virtual ~RenderNode() = default;

    virtual RenderNodeDescriptor Setup(renderer::RenderContext& ctx, RenderGraphContext& graphCtx) = 0;

    virtual core::Result<void> Draw(renderer::RenderContext& ctx,
                                    RenderNodeContext& nodeCtx,
                                    RenderGraphContext& graphCtx,
                                    renderer::World world) = 0;

    virtual core::Result<void> Resize(glm::uvec2 extent) {
        (void)extent;
        return core::Result<void>::Ok();
    }
};

// A set-up node together with its resolved context and lifecycle state
class RenderNodeWrapper {
public:
    // Resolves the node's pipeline against its target format. A descriptor
    // without a shader yields a node with no pipeline, which can draw only
    // without submitting passes.
    static RenderNodeWrapper Create(renderer::RenderContext& ctx,
                                    std::string name,
                                    std::unique_ptr<RenderNode> node,
                                    RenderNodeDescriptor descriptor);

    RenderNodeWrapper(RenderNodeWrapper&&) noexcept = default;
    RenderNodeWrapper& operator=(RenderNodeWrapper&&) noexcept = default;
    RenderNodeWrapper(const RenderNodeWrapper&) = delete;
    RenderNodeWrapper& operator=(const RenderNodeWrapper&) = delete;

    const std::string& Name() const { return context_.Name; }

    RenderNode& Node() { return *node_; }
    RenderNodeContext& Context() { return context_; }
    const RenderNodeContext& Context() const { return context_; }

    NodeState State() const { return state_; }
    void SetState(NodeState state) { state_ = state; }

private:
    RenderNodeWrapper(std::unique_ptr<RenderNode> node, RenderNodeContext context);

    std::unique_ptr<RenderNode> node_;
    RenderNodeContext context_;
    NodeState state_ = NodeState::Uninitialized;
};

} // namespace trellis::render_graph
