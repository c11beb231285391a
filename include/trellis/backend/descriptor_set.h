// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "trellis/backend/types.h"

namespace trellis::backend {

struct DescriptorWrite {
    uint32_t Binding = 0;
    DescriptorBindingType Type = DescriptorBindingType::UniformBuffer;
    ResourceId Resource = INVALID_RESOURCE_ID;
};

struct DescriptorSetDesc {
    std::optional<std::string> Label;
    DescriptorSetLayoutHandle Layout;
    std::vector<DescriptorWrite> Writes;
};

/**
 * Collects the writes of a descriptor set against a layout; the render context
 * hands the result to the backend.
 *
 *   auto set = ctx.BuildDescriptorSet(
 *       DescriptorSetBuilder(layout).Label("output").Sampler(0, sampler).TextureView(1, tex));
 */
class DescriptorSetBuilder {
public:
    explicit DescriptorSetBuilder(const DescriptorSetLayoutHandle& layout);

    DescriptorSetBuilder& Label(const std::string& label);
    DescriptorSetBuilder& Uniform(uint32_t binding, const BufferHandle& buffer);
    DescriptorSetBuilder& Storage(uint32_t binding, const BufferHandle& buffer, bool readOnly = false);
    DescriptorSetBuilder& TextureView(uint32_t binding, const TextureHandle& texture);
    DescriptorSetBuilder& Sampler(uint32_t binding, const SamplerHandle& sampler);

    const DescriptorSetDesc& Desc() const { return desc_; }
    DescriptorSetDesc Build() const { return desc_; }

private:
    DescriptorSetBuilder& Push(uint32_t binding, DescriptorBindingType type, ResourceId resource);

    DescriptorSetDesc desc_;
};

} // namespace trellis::backend
