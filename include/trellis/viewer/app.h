// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "trellis/core/config.h"
#include "trellis/renderer/renderer.h"
#include "trellis/renderer/world.h"

namespace trellis::viewer {

constexpr int EXIT_STRUCTURAL_ERROR = 1;
constexpr int EXIT_FATAL_BACKEND = 2;

// Default frame count when the config leaves it open
constexpr unsigned DEFAULT_FRAME_LIMIT = 120;

class App;

// Wires nodes into the app's graph before the frame loop starts
class Plugin {
public:
    virtual ~Plugin() = default;
    virtual void Init(App& app) = 0;
};

struct RunStats {
    uint64_t Presented = 0;
    uint64_t Skipped = 0;
    uint64_t Dropped = 0;
};

class App {
public:
    explicit App(config::AppConfig config);

    App& AddPlugin(std::unique_ptr<Plugin> plugin);

    void SetWorld(renderer::World world) { world_ = world; }
    void SetPrintOrder(bool enabled) { printOrder_ = enabled; }

    // Run plugins, validate the graph and render the configured number of frames.
    // Returns the process exit code.
    int Run();

    renderer::Renderer& GetRenderer() { return renderer_; }
    const config::AppConfig& Config() const { return config_; }
    const RunStats& Stats() const { return stats_; }

private:
    int RunFrames();

    config::AppConfig config_;
    renderer::Renderer renderer_;
    std::vector<std::unique_ptr<Plugin>> plugins_;
    renderer::World world_{};
    RunStats stats_;
    bool printOrder_ = false;
};

} // namespace trellis::viewer
