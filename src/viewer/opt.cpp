// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trellis/viewer/opt.h"

#include <charconv>
#include <string_view>

#include <fmt/format.h>

#include "trellis/core/error.h"
#include "trellis/core/log.h"

namespace trellis::viewer {

namespace {

std::optional<uint32_t> parse_dimension(std::string_view text) {
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value == 0) {
        return std::nullopt;
    }
    return value;
}

} // namespace

void Opt::Register(CLI::App& app) {
    app.add_option("-c,--config", config, "Path to the viewer config file (JSON)");
    app.add_option("--frames", frames, "Number of frames to render before exiting");
    app.add_option("--width", width, "Surface width");
    app.add_option("--height", height, "Surface height");
    app.add_option("--backend", backend, "Render backend")
        ->check(CLI::IsMember({"software", "headless"}, CLI::ignore_case));
    app.add_option("--log-level", log_level, "trace, debug, info, warn, error, critical or off");
    app.add_option("--resize-at", resize_at, "Resize the surface when this frame is reached");
    app.add_option("--resize-to", resize_to, "Extent used by --resize-at, as WIDTHxHEIGHT");
    app.add_flag("--print-order", print_order, "Log the execution order of the graph before rendering");
}

config::AppConfig Opt::ResolveConfig() const {
    auto resolved = config::load_from_file(config);

    if (frames) resolved.frame_limit = *frames;
    if (width) resolved.window_width = *width;
    if (height) resolved.window_height = *height;
    if (backend) resolved.backend = config::parse_backend_kind(*backend);
    if (log_level) resolved.log_level = log::parse_level(*log_level);
    if (resize_at) resolved.resize_at_frame = *resize_at;
    if (resize_to) {
        auto extent = ParseExtent(*resize_to);
        resolved.resize_width = extent.x;
        resolved.resize_height = extent.y;
    }

    if (resolved.resize_at_frame && (resolved.resize_width == 0 || resolved.resize_height == 0)) {
        throw ConfigError("a resize frame was given without a target extent (--resize-to WIDTHxHEIGHT)");
    }
    return resolved;
}

glm::uvec2 ParseExtent(const std::string& value) {
    auto separator = value.find_first_of("xX");
    if (separator != std::string::npos) {
        auto w = parse_dimension(std::string_view(value).substr(0, separator));
        auto h = parse_dimension(std::string_view(value).substr(separator + 1));
        if (w && h) {
            return glm::uvec2(*w, *h);
        }
    }
    throw ConfigError(fmt::format("invalid extent '{}' (expected WIDTHxHEIGHT)", value));
}

} // namespace trellis::viewer
