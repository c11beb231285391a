// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <optional>
#include <span>
#include <string_view>

#include <glm/glm.hpp>

#include "trellis/backend/types.h"

namespace trellis::renderer {

// Something a pass can draw: geometry plus named per-object resources
class Drawable {
public:
    virtual ~Drawable() = default;

    virtual const backend::BufferHandle& VertexBuffer() const = 0;
    virtual const backend::BufferHandle& IndexBuffer() const = 0;

    virtual std::optional<backend::DescriptorSetHandle> GetResource(std::string_view key) const {
        (void)key;
        return std::nullopt;
    }

    virtual glm::mat4 Transform() const { return glm::mat4(1.0f); }
};

// Scene-wide state such as a camera or lights
class Global {
public:
    virtual ~Global() = default;

    virtual std::optional<backend::DescriptorSetHandle> GetResource(std::string_view key) const = 0;
};

/**
 * Read-only view of the scene for one frame. The graph passes it to every
 * node untouched; the caller owns the objects and keeps them alive for the
 * duration of BeginDraw.
 */
struct World {
    std::span<const Drawable* const> Drawables;
    std::span<const Global* const> Globals;

    // First global that provides `key`
    std::optional<backend::DescriptorSetHandle> FindGlobal(std::string_view key) const {
        for (const Global* global : Globals) {
            if (auto resource = global->GetResource(key)) {
                return resource;
            }
        }
        return std::nullopt;
    }
};

} // namespace trellis::renderer
