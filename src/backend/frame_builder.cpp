// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trellis/backend/frame_builder.h"

#include <string>
#include <utility>

namespace trellis::backend {

FrameBuilder& FrameBuilder::BindVertexBuffer(const BufferHandle& vertexBuffer) {
    if (vertexBuffer.Usage != BufferUsage::Vertex) {
        Invalidate("buffer bound as vertex buffer was not created as one");
        return *this;
    }
    commands_.emplace_back(cmd::BindVertexBuffer{vertexBuffer});
    vertexCount_ = vertexBuffer.ElementCount;
    return *this;
}

FrameBuilder& FrameBuilder::BindIndexBuffer(const BufferHandle& indexBuffer) {
    if (indexBuffer.Usage != BufferUsage::Index) {
        Invalidate("buffer bound as index buffer was not created as one");
        return *this;
    }
    commands_.emplace_back(cmd::BindIndexBuffer{indexBuffer});
    indexCount_ = indexBuffer.ElementCount;
    return *this;
}

FrameBuilder& FrameBuilder::BindDescriptorSet(uint32_t slot, const DescriptorSetHandle& set) {
    if (!set.IsValid()) {
        Invalidate("descriptor set bound at slot " + std::to_string(slot) + " is invalid");
        return *this;
    }
    commands_.emplace_back(cmd::BindDescriptorSet{slot, set});
    return *this;
}

FrameBuilder& FrameBuilder::DebugMarker(const std::string& label) {
    commands_.emplace_back(cmd::DebugMarker{label});
    return *this;
}

FrameBuilder& FrameBuilder::Draw() {
    if (!vertexCount_) {
        Invalidate("draw without a bound vertex buffer");
        return *this;
    }
    commands_.emplace_back(cmd::Draw{*vertexCount_});
    ++drawCalls_;
    return *this;
}

FrameBuilder& FrameBuilder::DrawIndexed() {
    if (!indexCount_) {
        Invalidate("indexed draw without a bound index buffer");
        return *this;
    }
    commands_.emplace_back(cmd::DrawIndexed{*indexCount_});
    ++drawCalls_;
    return *this;
}

void FrameBuilder::Invalidate(const std::string& reason) {
    // Keep the first reason, it is usually the root cause
    if (!invalidReason_) {
        invalidReason_ = reason;
    }
}

} // namespace trellis::backend
