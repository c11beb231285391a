// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trellis/backend/descriptor_set.h"

namespace trellis::backend {

DescriptorSetBuilder::DescriptorSetBuilder(const DescriptorSetLayoutHandle& layout) {
    desc_.Layout = layout;
}

DescriptorSetBuilder& DescriptorSetBuilder::Label(const std::string& label) {
    desc_.Label = label;
    return *this;
}

DescriptorSetBuilder& DescriptorSetBuilder::Uniform(uint32_t binding, const BufferHandle& buffer) {
    return Push(binding, DescriptorBindingType::UniformBuffer, buffer.Id);
}

DescriptorSetBuilder& DescriptorSetBuilder::Storage(uint32_t binding, const BufferHandle& buffer, bool readOnly) {
    auto type = readOnly ? DescriptorBindingType::ReadOnlyStorageBuffer : DescriptorBindingType::StorageBuffer;
    return Push(binding, type, buffer.Id);
}

DescriptorSetBuilder& DescriptorSetBuilder::TextureView(uint32_t binding, const TextureHandle& texture) {
    return Push(binding, DescriptorBindingType::TextureView, texture.Id);
}

DescriptorSetBuilder& DescriptorSetBuilder::Sampler(uint32_t binding, const SamplerHandle& sampler) {
    return Push(binding, DescriptorBindingType::Sampler, sampler.Id);
}

DescriptorSetBuilder& DescriptorSetBuilder::Push(uint32_t binding, DescriptorBindingType type, ResourceId resource) {
    desc_.Writes.push_back(DescriptorWrite{binding, type, resource});
    return *this;
}

} // namespace trellis::backend
