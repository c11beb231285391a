// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trellis/renderer/render_context.h"

#include <utility>

#include <fmt/format.h>

#include "trellis/render_graph/node.h"

namespace trellis::renderer {

RenderContext::RenderContext(backend::RenderBackend& backend) : backend_(backend) {}

backend::BufferHandle RenderContext::CreateVertexBuffer(std::span<const Vertex> vertices,
                                                        std::optional<std::string> label) {
    backend::BufferCreateInfo info{std::move(label), backend::BufferUsage::Vertex,
                                   static_cast<uint32_t>(vertices.size())};
    return backend_.CreateBuffer(info, std::as_bytes(vertices));
}

backend::BufferHandle RenderContext::CreateIndexBuffer(std::span<const uint32_t> indices,
                                                       std::optional<std::string> label) {
    backend::BufferCreateInfo info{std::move(label), backend::BufferUsage::Index,
                                   static_cast<uint32_t>(indices.size())};
    return backend_.CreateBuffer(info, std::as_bytes(indices));
}

backend::TextureHandle RenderContext::CreateTexture(const backend::TextureCreateInfo& info) {
    return backend_.CreateTexture(info);
}

backend::SamplerHandle RenderContext::CreateSampler(const backend::SamplerOptions& options) {
    return backend_.CreateSampler(options);
}

backend::DescriptorSetLayoutHandle RenderContext::CreateDescriptorSetLayout(const backend::DescriptorSetLayoutDesc& desc) {
    return backend_.CreateDescriptorSetLayout(desc);
}

backend::DescriptorSetHandle RenderContext::BuildDescriptorSet(const backend::DescriptorSetBuilder& builder) {
    return backend_.CreateDescriptorSet(builder.Desc());
}

void RenderContext::DestroyTexture(const backend::TextureHandle& texture) {
    backend_.DestroyTexture(texture);
}

void RenderContext::DestroyDescriptorSet(const backend::DescriptorSetHandle& set) {
    backend_.DestroyDescriptorSet(set);
}

backend::GraphicsShader RenderContext::CreateShaderPair(const backend::ShaderPair& pair) {
    return backend_.CreateShaderPair(pair);
}

backend::PipelineHandle RenderContext::CreatePipeline(const backend::PipelineCreateInfo& info) {
    return backend_.CreatePipeline(info);
}

core::Result<void> RenderContext::Render(const render_graph::RenderNodeContext& node,
                                         const std::function<void(backend::FrameBuilder&)>& record) {
    if (!node.Pipeline.IsValid()) {
        return core::MakeError(core::ErrorKind::NodeDraw, "node has no pipeline to render with", node.Name);
    }

    backend::FrameBuilder frame;
    record(frame);

    if (!frame.IsValid()) {
        return core::MakeError(core::ErrorKind::NodeDraw,
                               fmt::format("invalid frame recording: {}", *frame.InvalidReason()), node.Name);
    }

    backend::PassSubmission submission;
    submission.Label = node.Name;
    submission.Pipeline = node.Pipeline;
    submission.Target = node.Target;
    submission.Commands = frame.TakeCommands();
    return backend_.Submit(std::move(submission));
}

} // namespace trellis::renderer
