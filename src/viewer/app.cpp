// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trellis/viewer/app.h"

#include <utility>

#include "trellis/backend/render_backend.h"
#include "trellis/core/log.h"
#include "trellis/core/time.h"

namespace trellis::viewer {

App::App(config::AppConfig config)
    : config_(std::move(config)), renderer_(renderer::Renderer::Create(config_)) {}

App& App::AddPlugin(std::unique_ptr<Plugin> plugin) {
    plugins_.push_back(std::move(plugin));
    return *this;
}

int App::Run() {
    try {
        time::ScopedTimer setupTimer("graph setup");
        for (auto& plugin : plugins_) {
            plugin->Init(*this);
        }
    } catch (const backend::BackendError& err) {
        TRELLIS_LOG_CRITICAL("Graph setup failed on the {} backend: {}", renderer_.Backend().Name(), err.what());
        return EXIT_FATAL_BACKEND;
    }

    auto& graph = renderer_.RenderGraphRef();
    auto valid = graph.Validate();
    if (valid.IsErr()) {
        const auto& error = valid.GetError();
        TRELLIS_LOG_CRITICAL("Refusing to start, invalid render graph ({}): {}", core::ToString(error.Kind),
                             error.Message);
        return EXIT_STRUCTURAL_ERROR;
    }

    if (printOrder_) {
        TRELLIS_LOG_INFO("Execution order: {}", graph.DescribeOrder());
    }

    try {
        return RunFrames();
    } catch (const backend::BackendError& err) {
        TRELLIS_LOG_CRITICAL("Backend failure: {}", err.what());
        return EXIT_FATAL_BACKEND;
    }
}

int App::RunFrames() {
    const unsigned frameLimit = config_.frame_limit == 0 ? DEFAULT_FRAME_LIMIT : config_.frame_limit;
    time::FrameTimer frameTimer;

    for (unsigned frame = 0; frame < frameLimit; ++frame) {
        if (config_.resize_at_frame && *config_.resize_at_frame == frame) {
            TRELLIS_LOG_INFO("Resizing to {}x{} at frame {}", config_.resize_width, config_.resize_height, frame);
            renderer_.Resize(glm::uvec2(config_.resize_width, config_.resize_height));
        }

        const double dt = frameTimer.tick();
        auto status = renderer_.BeginDraw(world_);
        if (status.IsErr()) {
            const auto& error = status.GetError();
            if (core::IsFatal(error.Kind)) {
                TRELLIS_LOG_CRITICAL("Stopping at frame {}: {}", frame, error.Message);
                return EXIT_FATAL_BACKEND;
            }
            if (core::IsStructural(error.Kind)) {
                TRELLIS_LOG_CRITICAL("Stopping at frame {}: {}", frame, error.Message);
                return EXIT_STRUCTURAL_ERROR;
            }
            ++stats_.Dropped;
            continue;
        }

        if (status.Value() == renderer::FrameStatus::Skipped) {
            ++stats_.Skipped;
        } else {
            ++stats_.Presented;
        }

        if (frame % 60 == 0) {
            TRELLIS_LOG_INFO("Frame {} | dt = {:.2f} ms (avg {:.2f} ms)", frame, dt * 1000.0,
                             frameTimer.filtered_delta() * 1000.0);
        }
    }

    TRELLIS_LOG_INFO("Rendered {} frames: {} presented, {} skipped, {} dropped", frameLimit, stats_.Presented,
                     stats_.Skipped, stats_.Dropped);
    return 0;
}

} // namespace trellis::viewer
