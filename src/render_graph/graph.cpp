// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trellis/render_graph/graph.h"

#include <algorithm>
#include <deque>
#include <unordered_map>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "trellis/backend/render_backend.h"
#include "trellis/core/log.h"
#include "trellis/renderer/render_context.h"

namespace trellis::render_graph {

using core::ErrorKind;

namespace {

// Kind reported for a resource creation that threw inside Draw
ErrorKind DrawErrorKind(const backend::BackendError& err) {
    switch (err.GetType()) {
        case backend::BackendError::Type::DeviceLost: return ErrorKind::FatalBackend;
        case backend::BackendError::Type::Headless: return ErrorKind::Headless;
        case backend::BackendError::Type::InvalidHandle:
        case backend::BackendError::Type::Allocation: return ErrorKind::NodeDraw;
    }
    return ErrorKind::NodeDraw;
}

} // namespace

void RenderGraph::AddNode(const std::string& name, RenderNodeWrapper node) {
    const bool inserted = nodes_.insert_or_assign(name, std::move(node)).second;
    TRELLIS_LOG_DEBUG("{} node '{}'", inserted ? "Added" : "Replaced", name);
    cachedOrder_.reset();
}

void RenderGraph::AddEdge(const std::string& producer, const std::string& consumer) {
    Edge edge{producer, consumer};
    if (std::find(edges_.begin(), edges_.end(), edge) != edges_.end()) {
        return;
    }
    edges_.push_back(std::move(edge));
    TRELLIS_LOG_DEBUG("Added edge '{}' -> '{}'", producer, consumer);
    cachedOrder_.reset();
    ancestry_.clear();
}

core::Result<std::vector<std::string>> RenderGraph::OrderNodes() {
    if (cachedOrder_) {
        return *cachedOrder_;
    }

    // std::map iteration is lexicographic, which seeds the queue deterministically
    std::map<std::string, size_t, std::less<>> indegree;
    for (const auto& [name, node] : nodes_) {
        indegree.emplace(name, 0);
    }

    std::unordered_map<std::string, std::vector<std::string>> successors;
    for (const auto& edge : edges_) {
        for (const std::string* endpoint : {&edge.Producer, &edge.Consumer}) {
            if (!nodes_.contains(*endpoint)) {
                auto message = fmt::format("edge '{}' -> '{}' references unknown node '{}'",
                                           edge.Producer, edge.Consumer, *endpoint);
                TRELLIS_LOG_ERROR("{}", message);
                return core::MakeError(ErrorKind::UnknownNode, message, *endpoint);
            }
        }
        successors[edge.Producer].push_back(edge.Consumer);
        ++indegree[edge.Consumer];
    }

    std::deque<std::string> ready;
    for (const auto& [name, degree] : indegree) {
        if (degree == 0) {
            ready.push_back(name);
        }
    }

    std::vector<std::string> order;
    order.reserve(nodes_.size());
    while (!ready.empty()) {
        auto name = std::move(ready.front());
        ready.pop_front();

        if (auto it = successors.find(name); it != successors.end()) {
            for (const auto& next : it->second) {
                if (--indegree[next] == 0) {
                    ready.push_back(next);
                }
            }
        }
        order.push_back(std::move(name));
    }

    if (order.size() < nodes_.size()) {
        std::vector<std::string> remaining;
        for (const auto& [name, degree] : indegree) {
            if (degree > 0) {
                remaining.push_back(name);
            }
        }
        auto message = fmt::format("cycle detected among nodes: {}", fmt::join(remaining, ", "));
        TRELLIS_LOG_ERROR("{}", message);
        return core::MakeError(ErrorKind::CycleDetected, message, remaining.front());
    }

    TRELLIS_LOG_DEBUG("Execution order: {}", fmt::join(order, " -> "));
    cachedOrder_ = order;
    return order;
}

core::Result<void> RenderGraph::Validate() {
    auto order = OrderNodes();
    if (order.IsErr()) {
        return std::move(order).GetError();
    }
    return core::Result<void>::Ok();
}

core::Result<void> RenderGraph::Render(renderer::RenderContext& ctx, renderer::World world) {
    auto order = OrderNodes();
    if (order.IsErr()) {
        return std::move(order).GetError();
    }

    for (const auto& name : order.Value()) {
        auto& wrapper = nodes_.at(name);
        wrapper.SetState(NodeState::Drawing);

        core::Result<void> result;
        try {
            ActiveNodeGuard active(context_, name);
            result = wrapper.Node().Draw(ctx, wrapper.Context(), context_, world);
        } catch (const backend::BackendError& err) {
            result = core::MakeError(DrawErrorKind(err), err.what(), name);
        }

        if (result.IsErr()) {
            auto error = std::move(result).GetError();
            if (error.Kind == ErrorKind::Generic) {
                error.Kind = ErrorKind::NodeDraw;
            }
            if (!error.Subject) {
                error.Subject = name;
            }
            AuditAccesses();
            return error.WithContext(fmt::format("node '{}'", name));
        }
    }

    AuditAccesses();
    return core::Result<void>::Ok();
}

core::Result<void> RenderGraph::Resize(glm::uvec2 extent) {
    std::optional<core::Error> first;
    for (auto& [name, wrapper] : nodes_) {
        auto result = wrapper.Node().Resize(extent);
        wrapper.SetState(NodeState::Resized);
        if (result.IsErr()) {
            TRELLIS_LOG_WARN("Node '{}' failed to resize to {}x{}: {}", name, extent.x, extent.y,
                             result.GetError().Message);
            if (!first) {
                auto error = std::move(result).GetError();
                if (!error.Subject) {
                    error.Subject = name;
                }
                first = error.WithContext(fmt::format("node '{}'", name));
            }
        }
    }

    if (first) {
        return std::move(*first);
    }
    return core::Result<void>::Ok();
}

bool RenderGraph::HasNode(std::string_view name) const {
    return nodes_.find(name) != nodes_.end();
}

std::vector<std::string> RenderGraph::NodeNames() const {
    std::vector<std::string> names;
    names.reserve(nodes_.size());
    for (const auto& [name, node] : nodes_) {
        names.push_back(name);
    }
    return names;
}

std::optional<NodeState> RenderGraph::StateOf(std::string_view name) const {
    auto it = nodes_.find(name);
    if (it == nodes_.end()) {
        return std::nullopt;
    }
    return it->second.State();
}

std::string RenderGraph::DescribeOrder() {
    auto order = OrderNodes();
    if (order.IsErr()) {
        return order.GetError().Message;
    }
    return fmt::format("{}", fmt::join(order.Value(), " -> "));
}

void RenderGraph::AuditAccesses() {
    auto accesses = context_.TakeAccesses();
    if (!context_.AuditSharedResources()) {
        return;
    }

    for (auto& access : accesses) {
        if (reported_.contains({access.Reader, access.Resource})) {
            continue;
        }
        if (IsAncestorCached(access.Publisher, access.Reader)) {
            continue;
        }
        reported_.emplace(access.Reader, access.Resource);
        TRELLIS_LOG_WARN("Node '{}' reads shared resource '{}' published by '{}' without an edge "
                         "ordering it after the publisher; declare the edge '{}' -> '{}'",
                         access.Reader, access.Resource, access.Publisher, access.Publisher, access.Reader);
        undeclared_.push_back(UndeclaredDependency{access.Reader, access.Resource, access.Publisher});
    }
}

bool RenderGraph::IsAncestorCached(const std::string& ancestor, const std::string& node) {
    auto key = std::make_pair(ancestor, node);
    if (auto it = ancestry_.find(key); it != ancestry_.end()) {
        return it->second;
    }
    const bool result = IsAncestor(ancestor, node);
    ancestry_.emplace(std::move(key), result);
    return result;
}

bool RenderGraph::IsAncestor(const std::string& ancestor, const std::string& node) const {
    std::vector<const std::string*> stack{&ancestor};
    std::set<std::string_view> visited;
    while (!stack.empty()) {
        const std::string* current = stack.back();
        stack.pop_back();
        if (!visited.insert(*current).second) {
            continue;
        }
        for (const auto& edge : edges_) {
            if (edge.Producer != *current) {
                continue;
            }
            if (edge.Consumer == node) {
                return true;
            }
            stack.push_back(&edge.Consumer);
        }
    }
    return false;
}

} // namespace trellis::render_graph
