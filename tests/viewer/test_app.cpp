// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <trellis/viewer/app.h>
#include <trellis/viewer/passes.h>

#include <functional>
#include <memory>

#include "../support/test_nodes.h"

using namespace trellis;
using namespace trellis::viewer;

namespace {

class LambdaPlugin : public Plugin {
public:
    explicit LambdaPlugin(std::function<void(App&)> init) : init_(std::move(init)) {}

    void Init(App& app) override { init_(app); }

private:
    std::function<void(App&)> init_;
};

config::AppConfig software_config(unsigned frames) {
    config::AppConfig config;
    config.window_width = 160;
    config.window_height = 90;
    config.frame_limit = frames;
    return config;
}

} // namespace

TEST_CASE("App renders the configured number of frames", "[viewer][app]") {
    App app(software_config(5));
    app.AddPlugin(std::make_unique<FractalPlugin>());

    REQUIRE(app.Run() == 0);
    REQUIRE(app.Stats().Presented == 5);
    REQUIRE(app.Stats().Dropped == 0);
    REQUIRE(app.GetRenderer().FrameIndex() == 5);
}

TEST_CASE("App refuses to start with an invalid graph", "[viewer][app]") {
    auto log = std::make_shared<test::CallLog>();
    App app(software_config(5));
    app.AddPlugin(std::make_unique<LambdaPlugin>([log](App& self) {
        self.GetRenderer()
            .Graph()
            .Emplace<test::RecordingNode>("main", "main", log)
            .AddEdge("main", "composite");
    }));

    REQUIRE(app.Run() == EXIT_STRUCTURAL_ERROR);
    REQUIRE(log->Draws.empty());
}

TEST_CASE("App keeps running when frames fail", "[viewer][app]") {
    auto log = std::make_shared<test::CallLog>();
    test::NodeBehavior failing;
    failing.FailDraw = core::ErrorKind::NodeDraw;

    App app(software_config(4));
    app.AddPlugin(std::make_unique<LambdaPlugin>([log, failing](App& self) {
        self.GetRenderer().Graph().Emplace<test::RecordingNode>("flaky", "flaky", log, failing);
    }));

    REQUIRE(app.Run() == 0);
    REQUIRE(app.Stats().Dropped == 4);
    REQUIRE(log->Draws.size() == 4);
}

TEST_CASE("App stops on fatal backend errors", "[viewer][app]") {
    SECTION("Headless backend cannot create the demo resources") {
        auto config = software_config(3);
        config.backend = config::BackendKind::Headless;

        App app(config);
        app.AddPlugin(std::make_unique<FractalPlugin>());
        REQUIRE(app.Run() == EXIT_FATAL_BACKEND);
    }

    SECTION("Headless backend cannot draw") {
        auto config = software_config(3);
        config.backend = config::BackendKind::Headless;
        auto log = std::make_shared<test::CallLog>();

        App app(config);
        app.AddPlugin(std::make_unique<LambdaPlugin>([log](App& self) {
            self.GetRenderer().Graph().Emplace<test::RecordingNode>("main", "main", log);
        }));

        REQUIRE(app.Run() == EXIT_FATAL_BACKEND);
        REQUIRE(log->Setups.size() == 1);
        REQUIRE(log->Draws.empty());
    }
}

TEST_CASE("App forwards scheduled resizes", "[viewer][app]") {
    auto config = software_config(4);
    config.resize_at_frame = 2;
    config.resize_width = 320;
    config.resize_height = 180;

    auto log = std::make_shared<test::CallLog>();
    App app(config);
    app.AddPlugin(std::make_unique<FractalPlugin>());
    app.AddPlugin(std::make_unique<LambdaPlugin>([log](App& self) {
        self.GetRenderer().Graph().Emplace<test::RecordingNode>("overlay", "overlay", log);
    }));

    REQUIRE(app.Run() == 0);
    REQUIRE(app.GetRenderer().Backend().SurfaceExtent() == glm::uvec2(320, 180));
    REQUIRE(log->Resizes == std::vector<std::string>{"overlay"});
    REQUIRE(app.Stats().Presented == 4);
}
