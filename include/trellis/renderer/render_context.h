// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <utility>

#include "trellis/backend/render_backend.h"
#include "trellis/core/result.h"
#include "trellis/renderer/vertex.h"

namespace trellis::render_graph {
struct RenderNodeContext;
}

namespace trellis::renderer {

/**
 * Resource creation and submission entry point handed to nodes during Setup
 * and Draw. Creation failures throw backend::BackendError; submission failures
 * come back as a Result the node can return from Draw.
 */
class RenderContext {
public:
    explicit RenderContext(backend::RenderBackend& backend);

    backend::BufferHandle CreateVertexBuffer(std::span<const Vertex> vertices,
                                             std::optional<std::string> label = std::nullopt);
    backend::BufferHandle CreateIndexBuffer(std::span<const uint32_t> indices,
                                            std::optional<std::string> label = std::nullopt);

    template<typename T>
    backend::BufferHandle CreateUniformBuffer(const T& value, std::optional<std::string> label = std::nullopt) {
        backend::BufferCreateInfo info{std::move(label), backend::BufferUsage::Uniform, 1};
        return backend_.CreateBuffer(info, std::as_bytes(std::span<const T>(&value, 1)));
    }

    template<typename T>
    backend::BufferHandle CreateStorageBuffer(std::span<const T> data, std::optional<std::string> label = std::nullopt) {
        backend::BufferCreateInfo info{std::move(label), backend::BufferUsage::Storage, static_cast<uint32_t>(data.size())};
        return backend_.CreateBuffer(info, std::as_bytes(data));
    }

    template<typename T>
    core::Result<void> WriteBuffer(const backend::BufferHandle& buffer, const T& value) {
        return backend_.WriteBuffer(buffer, std::as_bytes(std::span<const T>(&value, 1)));
    }

    backend::TextureHandle CreateTexture(const backend::TextureCreateInfo& info);
    backend::SamplerHandle CreateSampler(const backend::SamplerOptions& options = {});
    backend::DescriptorSetLayoutHandle CreateDescriptorSetLayout(const backend::DescriptorSetLayoutDesc& desc);
    backend::DescriptorSetHandle BuildDescriptorSet(const backend::DescriptorSetBuilder& builder);
    backend::GraphicsShader CreateShaderPair(const backend::ShaderPair& pair);
    backend::PipelineHandle CreatePipeline(const backend::PipelineCreateInfo& info);

    void DestroyTexture(const backend::TextureHandle& texture);
    void DestroyDescriptorSet(const backend::DescriptorSetHandle& set);

    // Record the node's commands and submit them against its pipeline and target
    core::Result<void> Render(const render_graph::RenderNodeContext& node,
                              const std::function<void(backend::FrameBuilder&)>& record);

    glm::uvec2 SurfaceExtent() const { return backend_.SurfaceExtent(); }
    backend::TextureFormat SurfaceFormat() const { return backend_.SurfaceFormat(); }

    // Number of frames started so far; the first frame drawn sees 0
    uint64_t FrameIndex() const { return frameIndex_; }
    void AdvanceFrame() { ++frameIndex_; }

    backend::RenderBackend& Backend() { return backend_; }
    const backend::RenderBackend& Backend() const { return backend_; }

private:
    backend::RenderBackend& backend_;
    uint64_t frameIndex_ = 0;
};

} // namespace trellis::renderer
