// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trellis/backend/headless_backend.h"

#include <string>

namespace trellis::backend {

namespace {

core::Error headless_error(const std::string& operation) {
    return core::MakeError(core::ErrorKind::Headless, "could not " + operation + " in headless mode");
}

} // namespace

HeadlessBackend::HeadlessBackend(glm::uvec2 extent) : extent_(extent) {}

BufferHandle HeadlessBackend::CreateBuffer(const BufferCreateInfo&, std::span<const std::byte>) {
    throw BackendError::Headless("create buffer");
}

TextureHandle HeadlessBackend::CreateTexture(const TextureCreateInfo&) {
    throw BackendError::Headless("create texture");
}

SamplerHandle HeadlessBackend::CreateSampler(const SamplerOptions&) {
    throw BackendError::Headless("create sampler");
}

DescriptorSetLayoutHandle HeadlessBackend::CreateDescriptorSetLayout(const DescriptorSetLayoutDesc&) {
    throw BackendError::Headless("create descriptor set layout");
}

DescriptorSetHandle HeadlessBackend::CreateDescriptorSet(const DescriptorSetDesc&) {
    throw BackendError::Headless("create descriptor set");
}

GraphicsShader HeadlessBackend::CreateShaderPair(const ShaderPair&) {
    throw BackendError::Headless("create shader pair");
}

PipelineHandle HeadlessBackend::CreatePipeline(const PipelineCreateInfo&) {
    throw BackendError::Headless("create pipeline");
}

core::Result<void> HeadlessBackend::WriteBuffer(const BufferHandle&, std::span<const std::byte>) {
    return headless_error("write buffer");
}

core::Result<void> HeadlessBackend::BeginFrame() {
    return headless_error("acquire a surface image");
}

core::Result<void> HeadlessBackend::Submit(PassSubmission) {
    return headless_error("submit a pass");
}

core::Result<void> HeadlessBackend::EndFrame() {
    return headless_error("present");
}

} // namespace trellis::backend
