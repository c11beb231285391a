// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trellis/render_graph/graph_context.h"

#include <fmt/format.h>

#include "trellis/core/log.h"

namespace trellis::render_graph {

void RenderGraphContext::AddSharedResource(const std::string& name, const backend::DescriptorSetHandle& resource) {
    auto& entry = resources_[name];
    entry.Resource = resource;
    entry.Publisher = activeNode_;
    TRELLIS_LOG_TRACE("Shared resource '{}' published by {}", name, activeNode_.value_or("<no node>"));
}

std::optional<backend::DescriptorSetHandle> RenderGraphContext::GetSharedResource(std::string_view name) const {
    auto it = resources_.find(name);
    if (it == resources_.end()) {
        return std::nullopt;
    }
    RecordAccess(name, it->second);
    return it->second.Resource;
}

core::Result<backend::DescriptorSetHandle> RenderGraphContext::RequireSharedResource(std::string_view name) const {
    if (auto resource = GetSharedResource(name)) {
        return *resource;
    }
    return core::MakeError(core::ErrorKind::MissingSharedResource,
                           fmt::format("shared resource '{}' has not been published", name),
                           std::string(name));
}

bool RenderGraphContext::HasSharedResource(std::string_view name) const {
    return resources_.find(name) != resources_.end();
}

bool RenderGraphContext::RemoveSharedResource(std::string_view name) {
    auto it = resources_.find(name);
    if (it == resources_.end()) {
        return false;
    }
    resources_.erase(it);
    return true;
}

std::optional<std::string> RenderGraphContext::PublisherOf(std::string_view name) const {
    auto it = resources_.find(name);
    if (it == resources_.end()) {
        return std::nullopt;
    }
    return it->second.Publisher;
}

void RenderGraphContext::SetAuditSharedResources(bool enabled) {
    audit_ = enabled;
    if (!audit_) {
        accesses_.clear();
    }
}

std::vector<SharedResourceAccess> RenderGraphContext::TakeAccesses() {
    std::vector<SharedResourceAccess> accesses;
    accesses.swap(accesses_);
    return accesses;
}

void RenderGraphContext::RecordAccess(std::string_view name, const Entry& entry) const {
    if (!audit_ || !activeNode_ || !entry.Publisher || *entry.Publisher == *activeNode_) {
        return;
    }
    accesses_.push_back(SharedResourceAccess{*activeNode_, std::string(name), *entry.Publisher});
}

} // namespace trellis::render_graph
