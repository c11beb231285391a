// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "trellis/backend/render_backend.h"

namespace trellis::backend {

// One frame as the software backend saw it
struct RecordedFrame {
    uint64_t Index = 0;
    std::vector<PassSubmission> Passes;
    bool Presented = false;
};

/**
 * CPU reference backend. Hands out handles, keeps buffer contents, checks every
 * handle it is given and records submitted passes instead of executing them.
 *
 * SimulateSurfaceLoss() and SimulateDeviceLoss() inject the two failure modes a
 * swapchain backend reports at acquire time.
 */
class SoftwareBackend : public RenderBackend {
public:
    explicit SoftwareBackend(const RenderBackendConfig& config = {});

    BufferHandle CreateBuffer(const BufferCreateInfo& info, std::span<const std::byte> contents) override;
    TextureHandle CreateTexture(const TextureCreateInfo& info) override;
    SamplerHandle CreateSampler(const SamplerOptions& options) override;
    DescriptorSetLayoutHandle CreateDescriptorSetLayout(const DescriptorSetLayoutDesc& desc) override;
    DescriptorSetHandle CreateDescriptorSet(const DescriptorSetDesc& desc) override;
    GraphicsShader CreateShaderPair(const ShaderPair& pair) override;
    PipelineHandle CreatePipeline(const PipelineCreateInfo& info) override;

    void DestroyTexture(const TextureHandle& texture) override;
    void DestroyDescriptorSet(const DescriptorSetHandle& set) override;

    core::Result<void> WriteBuffer(const BufferHandle& buffer, std::span<const std::byte> contents) override;

    core::Result<void> BeginFrame() override;
    core::Result<void> Submit(PassSubmission submission) override;
    core::Result<void> EndFrame() override;
    void AbandonFrame() override;

    void Resize(glm::uvec2 extent) override;
    glm::uvec2 SurfaceExtent() const override { return extent_; }
    TextureFormat SurfaceFormat() const override { return format_; }

    std::string_view Name() const override { return "software"; }

    // Inspection
    std::optional<std::vector<std::byte>> ReadBuffer(const BufferHandle& buffer) const;
    // Writes a descriptor set was created with, or nullptr for an unknown set
    const std::vector<DescriptorWrite>* DescriptorSetWrites(const DescriptorSetHandle& set) const;
    // The most recent finished frames, oldest first, at most FrameHistory of them
    const std::deque<RecordedFrame>& Frames() const { return frames_; }
    const RecordedFrame* CurrentFrame() const { return current_ ? &*current_ : nullptr; }
    uint64_t PresentedFrameCount() const { return presented_; }
    size_t ObjectCount() const;
    bool Vsync() const { return vsync_; }

    // Fault injection
    void SimulateSurfaceLoss() { surfaceLost_ = true; }
    void SimulateDeviceLoss() { deviceLost_ = true; }

private:
    ResourceId NextId() { return nextId_++; }

    bool IsKnownResource(DescriptorBindingType type, ResourceId id) const;
    core::Result<void> ValidateCommands(const std::vector<FrameCommand>& commands) const;
    core::Result<void> CheckDevice(const char* operation) const;
    void RetireFrame();

    struct BufferEntry {
        BufferHandle Handle;
        std::vector<std::byte> Bytes;
    };

    ResourceId nextId_ = 1;
    std::unordered_map<ResourceId, BufferEntry> buffers_;
    std::unordered_map<ResourceId, TextureHandle> textures_;
    std::unordered_set<ResourceId> samplers_;
    std::unordered_map<ResourceId, DescriptorSetLayoutHandle> layouts_;
    std::unordered_map<ResourceId, std::vector<DescriptorWrite>> descriptorSets_;
    std::unordered_set<ResourceId> shaders_;
    std::unordered_map<ResourceId, TextureFormat> pipelines_;

    glm::uvec2 extent_;
    TextureFormat format_;
    bool vsync_;
    size_t frameHistory_;

    std::deque<RecordedFrame> frames_;
    std::optional<RecordedFrame> current_;
    uint64_t frameCounter_ = 0;
    uint64_t presented_ = 0;

    bool surfaceLost_ = false;
    bool deviceLost_ = false;
};

} // namespace trellis::backend
