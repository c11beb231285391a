// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trellis/backend/software_backend.h"

#include <algorithm>
#include <string>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

#include "trellis/core/log.h"

namespace trellis::backend {

using core::ErrorKind;

SoftwareBackend::SoftwareBackend(const RenderBackendConfig& config)
    : extent_(config.SurfaceExtent), format_(config.SurfaceFormat), vsync_(config.Vsync),
      frameHistory_(config.FrameHistory) {
    TRELLIS_LOG_DEBUG("Software backend: {}x{} {}", extent_.x, extent_.y, ToString(format_));
}

BufferHandle SoftwareBackend::CreateBuffer(const BufferCreateInfo& info, std::span<const std::byte> contents) {
    auto name = info.Label.value_or("buffer");
    if (contents.empty()) {
        throw BackendError::Allocation(name, "zero-sized buffer");
    }

    BufferHandle handle;
    handle.Id = NextId();
    handle.Usage = info.Usage;
    handle.Size = contents.size();
    handle.ElementCount = info.ElementCount;

    buffers_.emplace(handle.Id, BufferEntry{handle, std::vector<std::byte>(contents.begin(), contents.end())});
    TRELLIS_LOG_TRACE("Created {} buffer '{}' ({} bytes)", ToString(info.Usage), name, handle.Size);
    return handle;
}

TextureHandle SoftwareBackend::CreateTexture(const TextureCreateInfo& info) {
    auto name = info.Label.value_or("texture");
    if (info.Width == 0 || info.Height == 0) {
        throw BackendError::Allocation(name, fmt::format("invalid extent {}x{}", info.Width, info.Height));
    }

    TextureHandle handle;
    handle.Id = NextId();
    handle.Width = info.Width;
    handle.Height = info.Height;
    handle.Format = info.Format;
    handle.Usage = info.Usage;

    textures_.emplace(handle.Id, handle);
    TRELLIS_LOG_TRACE("Created texture '{}' {}x{} {}", name, info.Width, info.Height, ToString(info.Format));
    return handle;
}

SamplerHandle SoftwareBackend::CreateSampler(const SamplerOptions&) {
    SamplerHandle handle{NextId()};
    samplers_.insert(handle.Id);
    return handle;
}

DescriptorSetLayoutHandle SoftwareBackend::CreateDescriptorSetLayout(const DescriptorSetLayoutDesc& desc) {
    DescriptorSetLayoutHandle handle;
    handle.Id = NextId();
    handle.Bindings = desc.Bindings;
    layouts_.emplace(handle.Id, handle);
    return handle;
}

DescriptorSetHandle SoftwareBackend::CreateDescriptorSet(const DescriptorSetDesc& desc) {
    auto name = desc.Label.value_or("descriptor set");

    auto layoutIt = layouts_.find(desc.Layout.Id);
    if (layoutIt == layouts_.end()) {
        throw BackendError::InvalidHandle(fmt::format("layout {} of '{}'", desc.Layout.Id, name));
    }
    const auto& bindings = layoutIt->second.Bindings;

    for (const auto& write : desc.Writes) {
        if (write.Binding >= bindings.size()) {
            throw BackendError::InvalidHandle(
                fmt::format("binding {} of '{}' is outside its layout ({} bindings)", write.Binding, name, bindings.size()));
        }
        if (bindings[write.Binding] != write.Type) {
            throw BackendError::InvalidHandle(fmt::format("binding {} of '{}' expects a {}, got a {}",
                write.Binding, name, ToString(bindings[write.Binding]), ToString(write.Type)));
        }
        if (!IsKnownResource(write.Type, write.Resource)) {
            throw BackendError::InvalidHandle(
                fmt::format("{} {} written to binding {} of '{}'", ToString(write.Type), write.Resource, write.Binding, name));
        }
    }

    DescriptorSetHandle handle;
    handle.Id = NextId();
    handle.Layout = desc.Layout.Id;
    handle.Label = name;
    descriptorSets_.emplace(handle.Id, desc.Writes);
    return handle;
}

GraphicsShader SoftwareBackend::CreateShaderPair(const ShaderPair& pair) {
    if (pair.Vertex.empty() || pair.Fragment.empty()) {
        throw BackendError::Allocation("shader pair", "empty shader source");
    }
    GraphicsShader handle{NextId()};
    shaders_.insert(handle.Id);
    return handle;
}

PipelineHandle SoftwareBackend::CreatePipeline(const PipelineCreateInfo& info) {
    auto name = info.Label.value_or("pipeline");
    if (!shaders_.contains(info.Shader.Id)) {
        throw BackendError::InvalidHandle(fmt::format("shader {} of pipeline '{}'", info.Shader.Id, name));
    }
    for (const auto& layout : info.Layouts) {
        if (!layouts_.contains(layout.Id)) {
            throw BackendError::InvalidHandle(fmt::format("layout {} of pipeline '{}'", layout.Id, name));
        }
    }

    PipelineHandle handle{NextId()};
    pipelines_.emplace(handle.Id, info.ColorFormat);
    TRELLIS_LOG_DEBUG("Created pipeline '{}' ({} layouts, {})", name, info.Layouts.size(), ToString(info.ColorFormat));
    return handle;
}

void SoftwareBackend::DestroyTexture(const TextureHandle& texture) {
    if (textures_.erase(texture.Id) == 0) {
        throw BackendError::InvalidHandle(fmt::format("destroy of unknown texture {}", texture.Id));
    }
    TRELLIS_LOG_TRACE("Destroyed texture {}", texture.Id);
}

void SoftwareBackend::DestroyDescriptorSet(const DescriptorSetHandle& set) {
    if (descriptorSets_.erase(set.Id) == 0) {
        throw BackendError::InvalidHandle(fmt::format("destroy of unknown descriptor set {}", set.Id));
    }
    TRELLIS_LOG_TRACE("Destroyed descriptor set {} '{}'", set.Id, set.Label);
}

core::Result<void> SoftwareBackend::WriteBuffer(const BufferHandle& buffer, std::span<const std::byte> contents) {
    if (auto device = CheckDevice("buffer write"); device.IsErr()) {
        return device;
    }

    auto it = buffers_.find(buffer.Id);
    if (it == buffers_.end()) {
        return core::MakeError(fmt::format("write to unknown buffer {}", buffer.Id));
    }
    auto& bytes = it->second.Bytes;
    if (contents.size() > bytes.size()) {
        return core::MakeError(
            fmt::format("write of {} bytes overflows buffer {} ({} bytes)", contents.size(), buffer.Id, bytes.size()));
    }

    std::copy(contents.begin(), contents.end(), bytes.begin());
    return core::Result<void>::Ok();
}

core::Result<void> SoftwareBackend::BeginFrame() {
    if (auto device = CheckDevice("surface acquire"); device.IsErr()) {
        return device;
    }
    if (surfaceLost_) {
        return core::MakeError(ErrorKind::SurfaceOutdated, "surface is outdated");
    }
    if (current_) {
        return core::MakeError("frame already in progress");
    }

    current_ = RecordedFrame{frameCounter_++, {}, false};
    return core::Result<void>::Ok();
}

core::Result<void> SoftwareBackend::Submit(PassSubmission submission) {
    if (auto device = CheckDevice("submit"); device.IsErr()) {
        return device;
    }
    if (!current_) {
        return core::MakeError(fmt::format("pass '{}' submitted outside of a frame", submission.Label));
    }

    auto pipelineIt = pipelines_.find(submission.Pipeline.Id);
    if (pipelineIt == pipelines_.end()) {
        return core::MakeError(fmt::format("pass '{}' uses unknown pipeline {}", submission.Label, submission.Pipeline.Id));
    }

    TextureFormat targetFormat = format_;
    if (submission.Target.IsTexture()) {
        const auto& texture = submission.Target.GetTexture();
        auto textureIt = textures_.find(texture.Id);
        if (textureIt == textures_.end()) {
            return core::MakeError(fmt::format("pass '{}' targets unknown texture {}", submission.Label, texture.Id));
        }
        if (!HasFlag(textureIt->second.Usage, TextureUsage::RenderAttachment)) {
            return core::MakeError(fmt::format(
                "pass '{}' targets texture {} which lacks render attachment usage", submission.Label, texture.Id));
        }
        targetFormat = textureIt->second.Format;
    }
    if (pipelineIt->second != targetFormat) {
        return core::MakeError(fmt::format("pass '{}' pipeline renders {} but its target is {}",
            submission.Label, ToString(pipelineIt->second), ToString(targetFormat)));
    }

    if (auto commands = ValidateCommands(submission.Commands); commands.IsErr()) {
        return std::move(commands).WithContext(fmt::format("pass '{}'", submission.Label));
    }

    current_->Passes.push_back(std::move(submission));
    return core::Result<void>::Ok();
}

core::Result<void> SoftwareBackend::EndFrame() {
    if (auto device = CheckDevice("present"); device.IsErr()) {
        return device;
    }
    if (!current_) {
        return core::MakeError("present without a frame in progress");
    }

    current_->Presented = true;
    RetireFrame();
    ++presented_;
    return core::Result<void>::Ok();
}

void SoftwareBackend::AbandonFrame() {
    if (!current_) {
        return;
    }
    TRELLIS_LOG_DEBUG("Abandoning frame {} with {} passes", current_->Index, current_->Passes.size());
    RetireFrame();
}

void SoftwareBackend::RetireFrame() {
    frames_.push_back(std::move(*current_));
    current_.reset();
    while (frames_.size() > frameHistory_) {
        frames_.pop_front();
    }
}

void SoftwareBackend::Resize(glm::uvec2 extent) {
    extent_ = extent;
    surfaceLost_ = false;
    TRELLIS_LOG_DEBUG("Software surface resized to {}x{}", extent.x, extent.y);
}

std::optional<std::vector<std::byte>> SoftwareBackend::ReadBuffer(const BufferHandle& buffer) const {
    auto it = buffers_.find(buffer.Id);
    if (it == buffers_.end()) {
        return std::nullopt;
    }
    return it->second.Bytes;
}

const std::vector<DescriptorWrite>* SoftwareBackend::DescriptorSetWrites(const DescriptorSetHandle& set) const {
    auto it = descriptorSets_.find(set.Id);
    return it == descriptorSets_.end() ? nullptr : &it->second;
}

size_t SoftwareBackend::ObjectCount() const {
    return buffers_.size() + textures_.size() + samplers_.size() + layouts_.size() + descriptorSets_.size() +
           shaders_.size() + pipelines_.size();
}

bool SoftwareBackend::IsKnownResource(DescriptorBindingType type, ResourceId id) const {
    switch (type) {
        case DescriptorBindingType::UniformBuffer:
        case DescriptorBindingType::StorageBuffer:
        case DescriptorBindingType::ReadOnlyStorageBuffer:
            return buffers_.contains(id);
        case DescriptorBindingType::TextureView:
            return textures_.contains(id);
        case DescriptorBindingType::Sampler:
            return samplers_.contains(id);
    }
    return false;
}

core::Result<void> SoftwareBackend::ValidateCommands(const std::vector<FrameCommand>& commands) const {
    for (const auto& command : commands) {
        auto result = std::visit([this](const auto& c) -> core::Result<void> {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, cmd::BindVertexBuffer> || std::is_same_v<T, cmd::BindIndexBuffer>) {
                if (!buffers_.contains(c.Buffer.Id)) {
                    return core::MakeError(fmt::format("binds unknown buffer {}", c.Buffer.Id));
                }
            } else if constexpr (std::is_same_v<T, cmd::BindDescriptorSet>) {
                if (!descriptorSets_.contains(c.Set.Id)) {
                    return core::MakeError(fmt::format("binds unknown descriptor set {} at slot {}", c.Set.Id, c.Slot));
                }
            }
            return core::Result<void>::Ok();
        }, command);

        if (result.IsErr()) {
            return result;
        }
    }
    return core::Result<void>::Ok();
}

core::Result<void> SoftwareBackend::CheckDevice(const char* operation) const {
    if (deviceLost_) {
        return core::MakeError(ErrorKind::FatalBackend, fmt::format("device lost during {}", operation));
    }
    return core::Result<void>::Ok();
}

} // namespace trellis::backend
