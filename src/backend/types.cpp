// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trellis/backend/types.h"

namespace trellis::backend {

const char* ToString(TextureFormat format) {
    switch (format) {
        case TextureFormat::RGBA8: return "rgba8";
        case TextureFormat::RGBA16: return "rgba16";
        case TextureFormat::R8: return "r8";
        case TextureFormat::R16: return "r16";
        case TextureFormat::BGRA8: return "bgra8";
    }
    return "unknown";
}

const char* ToString(BufferUsage usage) {
    switch (usage) {
        case BufferUsage::Vertex: return "vertex";
        case BufferUsage::Index: return "index";
        case BufferUsage::Uniform: return "uniform";
        case BufferUsage::Storage: return "storage";
    }
    return "unknown";
}

const char* ToString(DescriptorBindingType type) {
    switch (type) {
        case DescriptorBindingType::UniformBuffer: return "uniform buffer";
        case DescriptorBindingType::TextureView: return "texture view";
        case DescriptorBindingType::Sampler: return "sampler";
        case DescriptorBindingType::StorageBuffer: return "storage buffer";
        case DescriptorBindingType::ReadOnlyStorageBuffer: return "read-only storage buffer";
    }
    return "unknown";
}

} // namespace trellis::backend
