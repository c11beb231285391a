// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "trellis/backend/render_backend.h"

namespace trellis::backend {

/**
 * Backend without a device. Every resource creation throws
 * BackendError::Headless and every frame call reports a Headless error, so a
 * graph can be built and validated but never drawn.
 */
class HeadlessBackend : public RenderBackend {
public:
    explicit HeadlessBackend(glm::uvec2 extent = glm::uvec2(1280, 720));

    BufferHandle CreateBuffer(const BufferCreateInfo& info, std::span<const std::byte> contents) override;
    TextureHandle CreateTexture(const TextureCreateInfo& info) override;
    SamplerHandle CreateSampler(const SamplerOptions& options) override;
    DescriptorSetLayoutHandle CreateDescriptorSetLayout(const DescriptorSetLayoutDesc& desc) override;
    DescriptorSetHandle CreateDescriptorSet(const DescriptorSetDesc& desc) override;
    GraphicsShader CreateShaderPair(const ShaderPair& pair) override;
    PipelineHandle CreatePipeline(const PipelineCreateInfo& info) override;

    // Nothing can be created, so there is nothing to release
    void DestroyTexture(const TextureHandle&) override {}
    void DestroyDescriptorSet(const DescriptorSetHandle&) override {}

    core::Result<void> WriteBuffer(const BufferHandle& buffer, std::span<const std::byte> contents) override;

    core::Result<void> BeginFrame() override;
    core::Result<void> Submit(PassSubmission submission) override;
    core::Result<void> EndFrame() override;
    void AbandonFrame() override {}

    void Resize(glm::uvec2 extent) override { extent_ = extent; }
    glm::uvec2 SurfaceExtent() const override { return extent_; }
    TextureFormat SurfaceFormat() const override { return TextureFormat::BGRA8; }

    std::string_view Name() const override { return "headless"; }
    bool IsHeadless() const override { return true; }

private:
    glm::uvec2 extent_;
};

} // namespace trellis::backend
