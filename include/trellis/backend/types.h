// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

namespace trellis::backend {

using ResourceId = uint64_t;

// Id 0 is never handed out by a backend
constexpr ResourceId INVALID_RESOURCE_ID = 0;

enum class TextureFormat {
    RGBA8,
    RGBA16,
    R8,
    R16,
    BGRA8,
};

constexpr uint32_t BytesPerPixel(TextureFormat format) {
    switch (format) {
        case TextureFormat::RGBA8: return 4;
        case TextureFormat::RGBA16: return 8;
        case TextureFormat::R8: return 1;
        case TextureFormat::R16: return 2;
        case TextureFormat::BGRA8: return 4;
    }
    return 4;
}

const char* ToString(TextureFormat format);

enum class TextureUsage : uint32_t {
    None = 0,
    CopySrc = 1 << 0,
    CopyDst = 1 << 1,
    RenderAttachment = 1 << 2,
    TextureBinding = 1 << 3,
};

constexpr TextureUsage operator|(TextureUsage a, TextureUsage b) {
    return static_cast<TextureUsage>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

constexpr TextureUsage operator&(TextureUsage a, TextureUsage b) {
    return static_cast<TextureUsage>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

constexpr bool HasFlag(TextureUsage value, TextureUsage flag) {
    return (value & flag) == flag;
}

enum class BufferUsage {
    Vertex,
    Index,
    Uniform,
    Storage,
};

const char* ToString(BufferUsage usage);

// How a texture is sampled outside of [0, 1]
enum class TextureMode {
    ClampToEdge,
    Repeat,
    MirrorRepeat,
};

// How a texture is sampled between two texels
enum class FilterMode {
    Linear,
    Nearest,
};

enum class StageFlags : uint32_t {
    None = 0,
    Vertex = 1 << 0,
    Fragment = 1 << 1,
};

constexpr StageFlags operator|(StageFlags a, StageFlags b) {
    return static_cast<StageFlags>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

enum class DescriptorBindingType {
    UniformBuffer,
    TextureView,
    Sampler,
    StorageBuffer,
    ReadOnlyStorageBuffer,
};

const char* ToString(DescriptorBindingType type);

enum class ShaderLanguage {
    Glsl,
    Wgsl,
};

struct BufferHandle {
    ResourceId Id = INVALID_RESOURCE_ID;
    BufferUsage Usage = BufferUsage::Vertex;
    uint64_t Size = 0;
    // Number of vertices or indices for vertex/index buffers, 1 for uniforms
    uint32_t ElementCount = 0;

    bool IsValid() const { return Id != INVALID_RESOURCE_ID; }
    bool operator==(const BufferHandle& other) const { return Id == other.Id; }
    bool operator!=(const BufferHandle& other) const { return Id != other.Id; }
};

struct TextureHandle {
    ResourceId Id = INVALID_RESOURCE_ID;
    uint32_t Width = 0;
    uint32_t Height = 0;
    TextureFormat Format = TextureFormat::RGBA8;
    TextureUsage Usage = TextureUsage::None;

    bool IsValid() const { return Id != INVALID_RESOURCE_ID; }
    glm::uvec2 Extent() const { return glm::uvec2(Width, Height); }
    bool operator==(const TextureHandle& other) const { return Id == other.Id; }
    bool operator!=(const TextureHandle& other) const { return Id != other.Id; }
};

struct SamplerHandle {
    ResourceId Id = INVALID_RESOURCE_ID;

    bool IsValid() const { return Id != INVALID_RESOURCE_ID; }
    bool operator==(const SamplerHandle& other) const { return Id == other.Id; }
};

struct DescriptorSetLayoutHandle {
    ResourceId Id = INVALID_RESOURCE_ID;
    std::vector<DescriptorBindingType> Bindings;

    bool IsValid() const { return Id != INVALID_RESOURCE_ID; }
    bool operator==(const DescriptorSetLayoutHandle& other) const { return Id == other.Id; }
};

struct DescriptorSetHandle {
    ResourceId Id = INVALID_RESOURCE_ID;
    ResourceId Layout = INVALID_RESOURCE_ID;
    std::string Label;

    bool IsValid() const { return Id != INVALID_RESOURCE_ID; }
    bool operator==(const DescriptorSetHandle& other) const { return Id == other.Id; }
    bool operator!=(const DescriptorSetHandle& other) const { return Id != other.Id; }
};

struct GraphicsShader {
    ResourceId Id = INVALID_RESOURCE_ID;

    bool IsValid() const { return Id != INVALID_RESOURCE_ID; }
    bool operator==(const GraphicsShader& other) const { return Id == other.Id; }
};

struct PipelineHandle {
    ResourceId Id = INVALID_RESOURCE_ID;

    bool IsValid() const { return Id != INVALID_RESOURCE_ID; }
    bool operator==(const PipelineHandle& other) const { return Id == other.Id; }
};

struct BufferCreateInfo {
    std::optional<std::string> Label;
    BufferUsage Usage = BufferUsage::Vertex;
    uint32_t ElementCount = 0;
};

struct TextureCreateInfo {
    std::optional<std::string> Label;
    uint32_t Width = 0;
    uint32_t Height = 0;
    TextureFormat Format = TextureFormat::RGBA8;
    TextureUsage Usage = TextureUsage::RenderAttachment | TextureUsage::TextureBinding;
};

struct SamplerOptions {
    TextureMode ModeU = TextureMode::ClampToEdge;
    TextureMode ModeV = TextureMode::ClampToEdge;
    TextureMode ModeW = TextureMode::ClampToEdge;
    FilterMode MagFilter = FilterMode::Linear;
    FilterMode MinFilter = FilterMode::Linear;
};

struct DescriptorSetLayoutDesc {
    std::optional<std::string> Label;
    StageFlags Visibility = StageFlags::Fragment;
    std::vector<DescriptorBindingType> Bindings;
};

struct ShaderPair {
    ShaderLanguage Language = ShaderLanguage::Glsl;
    std::string Vertex;
    std::string Fragment;

    static ShaderPair Glsl(std::string vert, std::string frag) {
        return ShaderPair{ShaderLanguage::Glsl, std::move(vert), std::move(frag)};
    }

    static ShaderPair Wgsl(std::string source) {
        // WGSL keeps both entry points in one module
        return ShaderPair{ShaderLanguage::Wgsl, source, source};
    }
};

struct PipelineCreateInfo {
    std::optional<std::string> Label;
    GraphicsShader Shader;
    std::vector<DescriptorSetLayoutHandle> Layouts;
    TextureFormat ColorFormat = TextureFormat::BGRA8;
};

} // namespace trellis::backend
