// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trellis/renderer/renderer.h"

#include <exception>
#include <utility>

#include "trellis/backend/headless_backend.h"
#include "trellis/backend/software_backend.h"
#include "trellis/core/error.h"
#include "trellis/core/log.h"

namespace trellis::renderer {

using core::ErrorKind;

const char* ToString(FrameStatus status) {
    switch (status) {
        case FrameStatus::Presented: return "presented";
        case FrameStatus::Skipped: return "skipped";
    }
    return "unknown";
}

namespace {

backend::RenderBackend& checked(const std::unique_ptr<backend::RenderBackend>& backend) {
    if (!backend) {
        throw TrellisError("Renderer requires a backend");
    }
    return *backend;
}

} // namespace

Renderer::Renderer(std::unique_ptr<backend::RenderBackend> backend)
    : backend_(std::move(backend)), context_(checked(backend_)) {
    TRELLIS_LOG_INFO("Renderer using {} backend", backend_->Name());
}

Renderer Renderer::Headless(glm::uvec2 extent) {
    return Renderer(std::make_unique<backend::HeadlessBackend>(extent));
}

Renderer Renderer::Create(const config::AppConfig& config) {
    glm::uvec2 extent(config.window_width, config.window_height);

    std::unique_ptr<backend::RenderBackend> backend;
    switch (config.backend) {
        case config::BackendKind::Headless:
            backend = std::make_unique<backend::HeadlessBackend>(extent);
            break;
        case config::BackendKind::Software: {
            backend::RenderBackendConfig backendConfig;
            backendConfig.SurfaceExtent = extent;
            backendConfig.Vsync = config.vsync;
            backend = std::make_unique<backend::SoftwareBackend>(backendConfig);
            break;
        }
    }

    Renderer renderer(std::move(backend));
    renderer.graph_.Context().SetAuditSharedResources(config.audit_shared_resources);
    return renderer;
}

render_graph::RenderNodeWrapper Renderer::SetupRenderNode(const std::string& name,
                                                          std::unique_ptr<render_graph::RenderNode> node) {
    if (!node) {
        throw TrellisError("node '" + name + "' is null");
    }

    TRELLIS_LOG_DEBUG("Setting up node '{}'", name);
    render_graph::RenderNodeDescriptor descriptor;
    {
        render_graph::ActiveNodeGuard active(graph_.Context(), name);
        descriptor = node->Setup(context_, graph_.Context());
    }
    return render_graph::RenderNodeWrapper::Create(context_, name, std::move(node), std::move(descriptor));
}

core::Result<FrameStatus> Renderer::BeginDraw(World world) {
    auto begin = backend_->BeginFrame();
    if (begin.IsErr()) {
        if (begin.GetError().Kind == ErrorKind::SurfaceOutdated) {
            TRELLIS_LOG_INFO("Surface outdated, skipping frame {}", context_.FrameIndex());
            backend_->Resize(backend_->SurfaceExtent());
            return FrameStatus::Skipped;
        }
        return std::move(begin).GetError();
    }

    core::Result<void> rendered;
    try {
        rendered = graph_.Render(context_, world);
    } catch (const std::exception& err) {
        // Close the frame so the next BeginDraw can start one, then let the caller decide
        TRELLIS_LOG_ERROR("Frame {} aborted by an exception: {}", context_.FrameIndex(), err.what());
        backend_->AbandonFrame();
        context_.AdvanceFrame();
        throw;
    }
    context_.AdvanceFrame();
    if (rendered.IsErr()) {
        backend_->AbandonFrame();
        const auto& error = rendered.GetError();
        if (core::IsRecoverable(error.Kind)) {
            TRELLIS_LOG_WARN("Frame dropped: {}", error.Message);
        } else {
            TRELLIS_LOG_ERROR("Frame failed: {}", error.Message);
        }
        return std::move(rendered).GetError();
    }

    auto end = backend_->EndFrame();
    if (end.IsErr()) {
        backend_->AbandonFrame();
        if (end.GetError().Kind == ErrorKind::SurfaceOutdated) {
            TRELLIS_LOG_INFO("Surface outdated at present, skipping frame");
            backend_->Resize(backend_->SurfaceExtent());
            return FrameStatus::Skipped;
        }
        return std::move(end).GetError();
    }

    return FrameStatus::Presented;
}

void Renderer::Resize(glm::uvec2 extent) {
    auto result = graph_.Resize(extent);
    if (result.IsErr()) {
        TRELLIS_LOG_WARN("Resize to {}x{}: {}", extent.x, extent.y, result.GetError().Message);
    }
    backend_->Resize(extent);
}

} // namespace trellis::renderer
