// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>
#include <glm/glm.hpp>

#include "trellis/core/config.h"

namespace trellis::viewer {

/**
 * trellis-viewer command line. Values given here override the config file.
 */
struct Opt {
    std::filesystem::path config = "data/config/viewer.json";
    std::optional<unsigned> frames;
    std::optional<uint32_t> width;
    std::optional<uint32_t> height;
    std::optional<std::string> backend;
    std::optional<std::string> log_level;
    std::optional<unsigned> resize_at;
    std::optional<std::string> resize_to;
    bool print_order = false;

    void Register(CLI::App& app);

    // Load the config file and apply the command line on top of it
    config::AppConfig ResolveConfig() const;
};

// "800x600" -> (800, 600); anything else throws ConfigError
glm::uvec2 ParseExtent(const std::string& value);

} // namespace trellis::viewer
