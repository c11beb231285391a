// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <type_traits>

#include <glm/glm.hpp>

namespace trellis::renderer {

struct Vertex {
    glm::vec3 Position{0.0f};
    glm::vec3 Normal{0.0f, 0.0f, 1.0f};
    glm::vec2 TexUv{0.0f};
};

static_assert(std::is_standard_layout_v<Vertex>, "Vertex is uploaded as raw bytes");

} // namespace trellis::renderer
