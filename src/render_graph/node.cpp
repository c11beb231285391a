// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trellis/render_graph/node.h"

#include <utility>

#include <fmt/format.h>

#include "trellis/core/error.h"
#include "trellis/core/log.h"
#include "trellis/renderer/render_context.h"

namespace trellis::render_graph {

core::Result<void> RenderNodeContext::Retarget(const backend::TextureHandle& texture) {
    if (Target.IsSurface()) {
        return core::MakeError(core::ErrorKind::Generic,
                               fmt::format("node '{}' renders to the surface and cannot be retargeted", Name), Name);
    }
    if (Target.GetTexture().Format != texture.Format) {
        return core::MakeError(core::ErrorKind::Generic,
                               fmt::format("node '{}' pipeline renders {}, new target is {}", Name,
                                           backend::ToString(Target.GetTexture().Format),
                                           backend::ToString(texture.Format)),
                               Name);
    }
    Target = RenderTarget::Texture(texture);
    return core::Result<void>::Ok();
}

const char* ToString(NodeState state) {
    switch (state) {
        case NodeState::Uninitialized: return "uninitialized";
        case NodeState::Configured: return "configured";
        case NodeState::Drawing: return "drawing";
        case NodeState::Resized: return "resized";
    }
    return "unknown";
}

RenderNodeWrapper::RenderNodeWrapper(std::unique_ptr<RenderNode> node, RenderNodeContext context)
    : node_(std::move(node)), context_(std::move(context)) {}

RenderNodeWrapper RenderNodeWrapper::Create(renderer::RenderContext& ctx,
                                            std::string name,
                                            std::unique_ptr<RenderNode> node,
                                            RenderNodeDescriptor descriptor) {
    if (!node) {
        throw TrellisError(fmt::format("node '{}' is null", name));
    }

    RenderNodeContext context;
    if (descriptor.Shader.IsValid()) {
        backend::PipelineCreateInfo info;
        info.Label = name;
        info.Shader = descriptor.Shader;
        info.Layouts = descriptor.DescriptorSetLayouts;
        info.ColorFormat =
            descriptor.Target.IsSurface() ? ctx.SurfaceFormat() : descriptor.Target.GetTexture().Format;
        context.Pipeline = ctx.CreatePipeline(info);
    }

    context.Name = std::move(name);
    context.Shader = descriptor.Shader;
    context.Layouts = std::move(descriptor.DescriptorSetLayouts);
    context.Target = descriptor.Target;

    TRELLIS_LOG_DEBUG("Node '{}' configured ({} target)", context.Name,
                      context.Target.IsSurface() ? "surface" : "texture");

    RenderNodeWrapper wrapper(std::move(node), std::move(context));
    wrapper.SetState(NodeState::Configured);
    return wrapper;
}

} // namespace trellis::render_graph
