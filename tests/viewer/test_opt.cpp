// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <trellis/core/error.h>
#include <trellis/viewer/opt.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

using namespace trellis;
using namespace trellis::viewer;

TEST_CASE("Extents are parsed from WIDTHxHEIGHT", "[viewer][opt]") {
    REQUIRE(ParseExtent("800x600") == glm::uvec2(800, 600));
    REQUIRE(ParseExtent("1920X1080") == glm::uvec2(1920, 1080));

    REQUIRE_THROWS_AS(ParseExtent("800"), ConfigError);
    REQUIRE_THROWS_AS(ParseExtent("x600"), ConfigError);
    REQUIRE_THROWS_AS(ParseExtent("0x600"), ConfigError);
    REQUIRE_THROWS_AS(ParseExtent("800x600x2"), ConfigError);
}

TEST_CASE("Command line overrides the config file", "[viewer][opt]") {
    Opt opt;
    opt.config = std::filesystem::temp_directory_path() / "trellis_no_such_viewer.json";

    SECTION("Defaults come through untouched") {
        auto config = opt.ResolveConfig();
        REQUIRE(config.window_width == 1280);
        REQUIRE(config.backend == config::BackendKind::Software);
    }

    SECTION("Flags parsed by CLI11") {
        CLI::App app;
        opt.Register(app);

        std::vector<std::string> args{"--print-order", "--resize-to", "320x200", "--resize-at", "4",
                                      "--log-level", "debug", "--backend", "headless",
                                      "--height", "480", "--width", "640", "--frames", "12"};
        // CLI11 consumes the vector from the back
        std::reverse(args.begin(), args.end());
        app.parse(args);

        auto config = opt.ResolveConfig();
        REQUIRE(opt.print_order);
        REQUIRE(config.frame_limit == 12);
        REQUIRE(config.window_width == 640);
        REQUIRE(config.window_height == 480);
        REQUIRE(config.backend == config::BackendKind::Headless);
        REQUIRE(config.log_level == spdlog::level::debug);
        REQUIRE(config.resize_at_frame == std::optional<unsigned>(4));
        REQUIRE(config.resize_width == 320);
        REQUIRE(config.resize_height == 200);
    }

    SECTION("Unknown backends are rejected by the parser") {
        CLI::App app;
        opt.Register(app);

        std::vector<std::string> args{"vulkan", "--backend"};
        REQUIRE_THROWS_AS(app.parse(args), CLI::ValidationError);
    }

    SECTION("A resize frame needs an extent") {
        opt.resize_at = 3;
        REQUIRE_THROWS_AS(opt.ResolveConfig(), ConfigError);
    }
}
