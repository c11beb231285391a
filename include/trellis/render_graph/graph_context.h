// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "trellis/backend/types.h"
#include "trellis/core/result.h"

namespace trellis::render_graph {

// A lookup of a shared resource made while a node was active
struct SharedResourceAccess {
    std::string Reader;
    std::string Resource;
    std::string Publisher;
};

/**
 * Named store through which nodes hand resources to later nodes, e.g. a main
 * pass publishing "main/output" for a composite pass to sample.
 *
 * Publishing replaces any previous entry; entries live as long as the graph.
 * The store does not order anything: a reader only sees a resource published
 * in the same frame when an edge puts it after the publisher. With auditing
 * enabled the context remembers who published what and who read it, so the
 * graph can report readers that rely on an undeclared ordering.
 */
class RenderGraphContext {
public:
    void AddSharedResource(const std::string& name, const backend::DescriptorSetHandle& resource);

    std::optional<backend::DescriptorSetHandle> GetSharedResource(std::string_view name) const;

    // Like GetSharedResource, but absence is a MissingSharedResource error
    core::Result<backend::DescriptorSetHandle> RequireSharedResource(std::string_view name) const;

    bool HasSharedResource(std::string_view name) const;
    bool RemoveSharedResource(std::string_view name);
    size_t SharedResourceCount() const { return resources_.size(); }

    // Node that published the current entry, if it was published by a node
    std::optional<std::string> PublisherOf(std::string_view name) const;

    void SetAuditSharedResources(bool enabled);
    bool AuditSharedResources() const { return audit_; }

    void SetActiveNode(std::optional<std::string> node) { activeNode_ = std::move(node); }
    const std::optional<std::string>& ActiveNode() const { return activeNode_; }

    // Accesses recorded since the last call
    std::vector<SharedResourceAccess> TakeAccesses();

private:
    struct Entry {
        backend::DescriptorSetHandle Resource;
        std::optional<std::string> Publisher;
    };

    void RecordAccess(std::string_view name, const Entry& entry) const;

    std::map<std::string, Entry, std::less<>> resources_;
    std::optional<std::string> activeNode_;
    bool audit_ = true;
    mutable std::vector<SharedResourceAccess> accesses_;
};

// Marks a node as active on the context for the lifetime of the guard
class ActiveNodeGuard {
public:
    ActiveNodeGuard(RenderGraphContext& context, const std::string& node) : context_(context) {
        context_.SetActiveNode(node);
    }
    ~ActiveNodeGuard() { context_.SetActiveNode(std::nullopt); }

    ActiveNodeGuard(const ActiveNodeGuard&) = delete;
    ActiveNodeGuard& operator=(const ActiveNodeGuard&) = delete;

private:
    RenderGraphContext& context_;
};

} // namespace trellis::render_graph
