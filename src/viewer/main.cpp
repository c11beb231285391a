// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trellis/core/config.h"
#include "trellis/core/error.h"
#include "trellis/core/log.h"
#include "trellis/viewer/app.h"
#include "trellis/viewer/opt.h"
#include "trellis/viewer/passes.h"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>

int main(int argc, char** argv) {
    CLI::App cli{"trellis-viewer - render graph demo (fractal pass composited to the surface)"};
    trellis::viewer::Opt opt;
    opt.Register(cli);
    CLI11_PARSE(cli, argc, argv);

    trellis::config::AppConfig config;
    try {
        config = opt.ResolveConfig();
    } catch (const trellis::ConfigError& err) {
        std::cerr << err.what() << std::endl;
        return EXIT_FAILURE;
    }

    trellis::log::init(config.log_level);
    TRELLIS_LOG_INFO("trellis viewer starting - {} backend, surface {}x{}",
                     trellis::config::backend_kind_name(config.backend), config.window_width, config.window_height);

    try {
        trellis::viewer::App app(config);
        app.SetPrintOrder(opt.print_order);
        app.AddPlugin(std::make_unique<trellis::viewer::FractalPlugin>());

        const int code = app.Run();
        TRELLIS_LOG_INFO("trellis viewer shutdown complete (exit code {})", code);
        return code;
    } catch (const std::exception& err) {
        TRELLIS_LOG_CRITICAL("{}", err.what());
        return EXIT_FAILURE;
    }
}
