// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <glm/glm.hpp>

#include "trellis/backend/descriptor_set.h"
#include "trellis/backend/frame_builder.h"
#include "trellis/backend/types.h"
#include "trellis/core/result.h"

namespace trellis::backend {

class BackendError : public std::exception {
public:
    enum class Type {
        Headless,
        InvalidHandle,
        DeviceLost,
        Allocation,
    };

    BackendError(Type type, const std::string& message) : m_type(type), m_message(message) {}

    const char* what() const noexcept override {
        return m_message.c_str();
    }

    Type GetType() const { return m_type; }

    static BackendError Headless(const std::string& operation) {
        return BackendError(Type::Headless, "could not " + operation + " in headless mode");
    }

    static BackendError InvalidHandle(const std::string& info) {
        return BackendError(Type::InvalidHandle, "Invalid resource handle: " + info);
    }

    static BackendError DeviceLost(const std::string& operation) {
        return BackendError(Type::DeviceLost, "device lost during " + operation);
    }

    static BackendError Allocation(const std::string& name, const std::string& inner) {
        return BackendError(Type::Allocation, "Allocation failed for " + name + ": " + inner);
    }

private:
    Type m_type;
    std::string m_message;
};

/**
 * Destination of a pass: the presentable surface, or an off-screen texture a
 * later pass may sample.
 */
class RenderTarget {
public:
    struct SurfaceTarget {
        bool operator==(const SurfaceTarget&) const { return true; }
    };

    static RenderTarget Surface() { return RenderTarget(SurfaceTarget{}); }
    static RenderTarget Texture(const TextureHandle& texture) { return RenderTarget(texture); }

    bool IsSurface() const { return std::holds_alternative<SurfaceTarget>(data_); }
    bool IsTexture() const { return std::holds_alternative<TextureHandle>(data_); }

    // Only valid for texture targets
    const TextureHandle& GetTexture() const { return std::get<TextureHandle>(data_); }

    bool operator==(const RenderTarget& other) const { return data_ == other.data_; }
    bool operator!=(const RenderTarget& other) const { return !(data_ == other.data_); }

private:
    explicit RenderTarget(std::variant<SurfaceTarget, TextureHandle> data) : data_(std::move(data)) {}

    std::variant<SurfaceTarget, TextureHandle> data_;
};

struct PassSubmission {
    std::string Label;
    PipelineHandle Pipeline;
    RenderTarget Target = RenderTarget::Surface();
    std::vector<FrameCommand> Commands;
};

struct RenderBackendConfig {
    glm::uvec2 SurfaceExtent{1280, 720};
    TextureFormat SurfaceFormat = TextureFormat::BGRA8;
    bool Vsync = false;
    // Finished frames a recording backend keeps for inspection; older ones are dropped
    size_t FrameHistory = 16;
};

/**
 * GPU backend seen by the render graph. Implementations own every GPU object;
 * the graph and its nodes only hold the opaque handles returned here.
 *
 * Resource creation throws BackendError on failure. Frame operations report
 * failures as core::Result so the renderer can tell a skipped frame from a
 * dead device.
 */
class RenderBackend {
public:
    virtual ~RenderBackend() = default;

    virtual BufferHandle CreateBuffer(const BufferCreateInfo& info, std::span<const std::byte> contents) = 0;
    virtual TextureHandle CreateTexture(const TextureCreateInfo& info) = 0;
    virtual SamplerHandle CreateSampler(const SamplerOptions& options) = 0;
    virtual DescriptorSetLayoutHandle CreateDescriptorSetLayout(const DescriptorSetLayoutDesc& desc) = 0;
    virtual DescriptorSetHandle CreateDescriptorSet(const DescriptorSetDesc& desc) = 0;
    virtual GraphicsShader CreateShaderPair(const ShaderPair& pair) = 0;
    virtual PipelineHandle CreatePipeline(const PipelineCreateInfo& info) = 0;

    // Release an object. Handles to it, and descriptor sets written with it, must not be used afterwards.
    virtual void DestroyTexture(const TextureHandle& texture) = 0;
    virtual void DestroyDescriptorSet(const DescriptorSetHandle& set) = 0;

    virtual core::Result<void> WriteBuffer(const BufferHandle& buffer, std::span<const std::byte> contents) = 0;

    // Acquire the surface image for a new frame
    virtual core::Result<void> BeginFrame() = 0;
    virtual core::Result<void> Submit(PassSubmission submission) = 0;
    // Present the frame started by BeginFrame
    virtual core::Result<void> EndFrame() = 0;
    // Drop the frame started by BeginFrame without presenting it
    virtual void AbandonFrame() = 0;

    virtual void Resize(glm::uvec2 extent) = 0;
    virtual glm::uvec2 SurfaceExtent() const = 0;
    virtual TextureFormat SurfaceFormat() const = 0;

    virtual std::string_view Name() const = 0;
    virtual bool IsHeadless() const { return false; }
};

} // namespace trellis::backend
