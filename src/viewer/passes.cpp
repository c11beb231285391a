// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trellis/viewer/passes.h"

#include <array>
#include <cmath>
#include <utility>

#include "trellis/backend/descriptor_set.h"
#include "trellis/core/common.h"
#include "trellis/core/log.h"
#include "trellis/renderer/renderer.h"
#include "trellis/renderer/vertex.h"

namespace trellis::viewer {

namespace {

constexpr const char* FULLSCREEN_VERT = R"(#version 450
layout(location = 0) in vec3 in_pos;
layout(location = 2) in vec2 in_uv;
layout(location = 0) out vec2 out_uv;
void main() {
    out_uv = in_uv;
    gl_Position = vec4(in_pos, 1.0);
}
)";

constexpr const char* FRACTAL_FRAG = R"(#version 450
layout(location = 0) in vec2 in_uv;
layout(location = 0) out vec4 out_color;
layout(set = 0, binding = 0) uniform Params {
    vec2 center;
    float zoom;
    float time;
    uvec2 extent;
    uint max_iterations;
};
void main() {
    float aspect = float(extent.x) / float(max(extent.y, 1u));
    vec2 c = center + (in_uv - 0.5) * vec2(aspect, 1.0) * 3.0 / zoom;
    vec2 z = vec2(0.0);
    uint i = 0u;
    for (; i < max_iterations && dot(z, z) < 4.0; ++i) {
        z = vec2(z.x * z.x - z.y * z.y, 2.0 * z.x * z.y) + c;
    }
    float t = float(i) / float(max_iterations);
    out_color = vec4(0.5 + 0.5 * cos(6.2831 * (t + vec3(0.0, 0.33, 0.67) + time * 0.1)), 1.0);
}
)";

constexpr const char* COMPOSITE_FRAG = R"(#version 450
layout(location = 0) in vec2 in_uv;
layout(location = 0) out vec4 out_color;
layout(set = 0, binding = 0) uniform sampler main_sampler;
layout(set = 0, binding = 1) uniform texture2D main_output;
void main() {
    out_color = texture(sampler2D(main_output, main_sampler), in_uv);
}
)";

backend::DescriptorSetLayoutDesc sampled_texture_layout(const char* label) {
    backend::DescriptorSetLayoutDesc desc;
    desc.Label = label;
    desc.Visibility = backend::StageFlags::Fragment;
    desc.Bindings = {backend::DescriptorBindingType::Sampler, backend::DescriptorBindingType::TextureView};
    return desc;
}

} // namespace

FullscreenQuad FullscreenQuad::Create(renderer::RenderContext& ctx) {
    const std::array<renderer::Vertex, 4> vertices = {{
        {{-1.0f, -1.0f, 0.0f}, {0.0f, 0.0f, 1.0f}, {0.0f, 1.0f}},
        {{1.0f, -1.0f, 0.0f}, {0.0f, 0.0f, 1.0f}, {1.0f, 1.0f}},
        {{1.0f, 1.0f, 0.0f}, {0.0f, 0.0f, 1.0f}, {1.0f, 0.0f}},
        {{-1.0f, 1.0f, 0.0f}, {0.0f, 0.0f, 1.0f}, {0.0f, 0.0f}},
    }};
    const std::array<uint32_t, 6> indices = {0, 1, 2, 2, 3, 0};

    FullscreenQuad quad;
    quad.Vertices = ctx.CreateVertexBuffer(vertices, "fullscreen quad vertices");
    quad.Indices = ctx.CreateIndexBuffer(indices, "fullscreen quad indices");
    return quad;
}

render_graph::RenderNodeDescriptor FractalPass::Setup(renderer::RenderContext& ctx,
                                                      render_graph::RenderGraphContext& graphCtx) {
    quad_ = FullscreenQuad::Create(ctx);

    params_.Extent = ctx.SurfaceExtent();
    paramsBuffer_ = ctx.CreateUniformBuffer(params_, "fractal params");

    backend::DescriptorSetLayoutDesc paramsLayoutDesc;
    paramsLayoutDesc.Label = "fractal params";
    paramsLayoutDesc.Visibility = backend::StageFlags::Fragment;
    paramsLayoutDesc.Bindings = {backend::DescriptorBindingType::UniformBuffer};
    auto paramsLayout = ctx.CreateDescriptorSetLayout(paramsLayoutDesc);
    paramsSet_ = ctx.BuildDescriptorSet(
        backend::DescriptorSetBuilder(paramsLayout).Label("fractal params").Uniform(0, paramsBuffer_));

    outputLayout_ = ctx.CreateDescriptorSetLayout(sampled_texture_layout("main output"));
    sampler_ = ctx.CreateSampler();
    CreateOutput(ctx, ctx.SurfaceExtent());
    graphCtx.AddSharedResource(MAIN_OUTPUT, outputSet_);

    render_graph::RenderNodeDescriptor descriptor;
    descriptor.Shader = ctx.CreateShaderPair(backend::ShaderPair::Glsl(FULLSCREEN_VERT, FRACTAL_FRAG));
    descriptor.DescriptorSetLayouts = {paramsLayout};
    descriptor.Target = render_graph::RenderTarget::Texture(texture_);
    return descriptor;
}

core::Result<void> FractalPass::Draw(renderer::RenderContext& ctx,
                                     render_graph::RenderNodeContext& nodeCtx,
                                     render_graph::RenderGraphContext& graphCtx,
                                     renderer::World world) {
    TRELLIS_UNUSED(world);

    if (pendingExtent_) {
        auto extent = *pendingExtent_;
        pendingExtent_.reset();
        if (extent.x > 0 && extent.y > 0 && extent != texture_.Extent()) {
            const auto oldTexture = texture_;
            const auto oldSet = outputSet_;
            CreateOutput(ctx, extent);
            auto retarget = nodeCtx.Retarget(texture_);
            if (retarget.IsErr()) {
                ReleaseOutput(ctx);
                texture_ = oldTexture;
                outputSet_ = oldSet;
                return retarget;
            }
            graphCtx.AddSharedResource(MAIN_OUTPUT, outputSet_);

            // Nothing refers to the previous output once it is no longer published
            ctx.DestroyDescriptorSet(oldSet);
            ctx.DestroyTexture(oldTexture);
            TRELLIS_LOG_DEBUG("Fractal output recreated at {}x{}", extent.x, extent.y);
        }
    }

    params_.Time = static_cast<float>(ctx.FrameIndex()) / 60.0f;
    params_.Zoom = 1.0f + 0.5f * std::sin(params_.Time * 0.25f);
    params_.Extent = texture_.Extent();
    auto written = ctx.WriteBuffer(paramsBuffer_, params_);
    if (written.IsErr()) {
        return std::move(written).WithContext("fractal params upload");
    }

    return ctx.Render(nodeCtx, [&](backend::FrameBuilder& frame) {
        frame.DebugMarker("fractal")
            .BindDescriptorSet(0, paramsSet_)
            .BindVertexBuffer(quad_.Vertices)
            .BindIndexBuffer(quad_.Indices)
            .DrawIndexed();
    });
}

core::Result<void> FractalPass::Resize(glm::uvec2 extent) {
    pendingExtent_ = extent;
    return core::Result<void>::Ok();
}

void FractalPass::CreateOutput(renderer::RenderContext& ctx, glm::uvec2 extent) {
    backend::TextureCreateInfo info;
    info.Label = "main output";
    info.Width = extent.x;
    info.Height = extent.y;
    info.Format = backend::TextureFormat::RGBA8;
    info.Usage = backend::TextureUsage::RenderAttachment | backend::TextureUsage::TextureBinding;
    texture_ = ctx.CreateTexture(info);

    outputSet_ = ctx.BuildDescriptorSet(
        backend::DescriptorSetBuilder(outputLayout_).Label(MAIN_OUTPUT).Sampler(0, sampler_).TextureView(1, texture_));
}

void FractalPass::ReleaseOutput(renderer::RenderContext& ctx) {
    ctx.DestroyDescriptorSet(outputSet_);
    ctx.DestroyTexture(texture_);
}

render_graph::RenderNodeDescriptor CompositePass::Setup(renderer::RenderContext& ctx,
                                                        render_graph::RenderGraphContext& graphCtx) {
    TRELLIS_UNUSED(graphCtx);
    quad_ = FullscreenQuad::Create(ctx);

    render_graph::RenderNodeDescriptor descriptor;
    descriptor.Shader = ctx.CreateShaderPair(backend::ShaderPair::Glsl(FULLSCREEN_VERT, COMPOSITE_FRAG));
    descriptor.DescriptorSetLayouts = {ctx.CreateDescriptorSetLayout(sampled_texture_layout("composite input"))};
    descriptor.Target = render_graph::RenderTarget::Surface();
    return descriptor;
}

core::Result<void> CompositePass::Draw(renderer::RenderContext& ctx,
                                       render_graph::RenderNodeContext& nodeCtx,
                                       render_graph::RenderGraphContext& graphCtx,
                                       renderer::World world) {
    TRELLIS_UNUSED(world);

    auto input = graphCtx.RequireSharedResource(MAIN_OUTPUT);
    if (input.IsErr()) {
        return std::move(input).GetError();
    }

    return ctx.Render(nodeCtx, [&](backend::FrameBuilder& frame) {
        frame.DebugMarker("composite")
            .BindDescriptorSet(0, input.Value())
            .BindVertexBuffer(quad_.Vertices)
            .BindIndexBuffer(quad_.Indices)
            .DrawIndexed();
    });
}

void RegisterFractalGraph(renderer::Renderer& renderer) {
    renderer.Graph()
        .Emplace<FractalPass>("main")
        .Emplace<CompositePass>("composite")
        .AddEdge("main", "composite");
}

} // namespace trellis::viewer
