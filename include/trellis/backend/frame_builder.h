// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "trellis/backend/types.h"

namespace trellis::backend {

namespace cmd {

struct BindVertexBuffer {
    BufferHandle Buffer;
};

struct BindIndexBuffer {
    BufferHandle Buffer;
};

struct BindDescriptorSet {
    uint32_t Slot = 0;
    DescriptorSetHandle Set;
};

struct DebugMarker {
    std::string Label;
};

struct Draw {
    uint32_t VertexCount = 0;
};

struct DrawIndexed {
    uint32_t IndexCount = 0;
};

} // namespace cmd

using FrameCommand = std::variant<
    cmd::BindVertexBuffer,
    cmd::BindIndexBuffer,
    cmd::BindDescriptorSet,
    cmd::DebugMarker,
    cmd::Draw,
    cmd::DrawIndexed>;

/**
 * Records the commands of one pass. Backends replay the recorded list on submit.
 *
 * Draw() and DrawIndexed() use the element count of the last bound vertex/index
 * buffer. Drawing without a bound buffer marks the builder invalid; the backend
 * rejects an invalid recording instead of submitting a partial pass.
 */
class FrameBuilder {
public:
    FrameBuilder() = default;

    FrameBuilder& BindVertexBuffer(const BufferHandle& vertexBuffer);
    FrameBuilder& BindIndexBuffer(const BufferHandle& indexBuffer);
    FrameBuilder& BindDescriptorSet(uint32_t slot, const DescriptorSetHandle& set);
    FrameBuilder& DebugMarker(const std::string& label);
    FrameBuilder& Draw();
    FrameBuilder& DrawIndexed();

    const std::vector<FrameCommand>& Commands() const { return commands_; }
    std::vector<FrameCommand> TakeCommands() { return std::move(commands_); }

    bool IsValid() const { return !invalidReason_.has_value(); }
    const std::optional<std::string>& InvalidReason() const { return invalidReason_; }

    uint32_t DrawCallCount() const { return drawCalls_; }

private:
    void Invalidate(const std::string& reason);

    std::vector<FrameCommand> commands_;
    std::optional<uint32_t> vertexCount_;
    std::optional<uint32_t> indexCount_;
    std::optional<std::string> invalidReason_;
    uint32_t drawCalls_ = 0;
};

} // namespace trellis::backend
