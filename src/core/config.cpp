// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trellis/core/config.h"

#include <fstream>
#include <sstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "trellis/core/common.h"
#include "trellis/core/error.h"
#include "trellis/core/log.h"

namespace trellis::config {
namespace {

void apply_json(AppConfig& config, const nlohmann::json& json) {
    if (auto window = json.find("window"); window != json.end()) {
        if (window->contains("width")) {
            config.window_width = (*window)["width"].get<uint32_t>();
        }
        if (window->contains("height")) {
            config.window_height = (*window)["height"].get<uint32_t>();
        }
    }

    if (auto logging = json.find("logging"); logging != json.end()) {
        if (logging->contains("level")) {
            config.log_level = log::parse_level((*logging)["level"].get<std::string>());
        }
    }

    if (auto renderer = json.find("renderer"); renderer != json.end()) {
        if (renderer->contains("backend")) {
            config.backend = parse_backend_kind((*renderer)["backend"].get<std::string>());
        }
        if (renderer->contains("vsync")) {
            config.vsync = (*renderer)["vsync"].get<bool>();
        }
    }

    if (auto graph = json.find("graph"); graph != json.end()) {
        if (graph->contains("audit_shared_resources")) {
            config.audit_shared_resources = (*graph)["audit_shared_resources"].get<bool>();
        }
    }

    if (auto bootstrap = json.find("bootstrap"); bootstrap != json.end()) {
        if (bootstrap->contains("frame_limit")) {
            config.frame_limit = (*bootstrap)["frame_limit"].get<unsigned>();
        }
        if (bootstrap->contains("resize_at_frame")) {
            config.resize_at_frame = (*bootstrap)["resize_at_frame"].get<unsigned>();
        }
        if (auto resize_to = bootstrap->find("resize_to"); resize_to != bootstrap->end()) {
            if (!resize_to->is_array() || resize_to->size() != 2) {
                throw ConfigError("bootstrap.resize_to must be an array of two integers");
            }
            config.resize_width = (*resize_to)[0].get<uint32_t>();
            config.resize_height = (*resize_to)[1].get<uint32_t>();
        }
    }
}

AppConfig parse_document(const std::string& text, const std::string& source) {
    AppConfig config{};
    try {
        apply_json(config, nlohmann::json::parse(text));
    } catch (const nlohmann::json::exception& err) {
        throw ConfigError(fmt::format("{}: {}", source, err.what()));
    }
    return config;
}

} // namespace

BackendKind parse_backend_kind(const std::string& value) {
    const auto lowered = to_lower(value);
    if (lowered == "software") return BackendKind::Software;
    if (lowered == "headless") return BackendKind::Headless;
    throw ConfigError(fmt::format("unknown backend '{}' (expected 'software' or 'headless')", value));
}

const char* backend_kind_name(BackendKind kind) {
    switch (kind) {
        case BackendKind::Software: return "software";
        case BackendKind::Headless: return "headless";
    }
    return "software";
}

AppConfig load_from_string(const std::string& text) {
    return parse_document(text, "<string>");
}

AppConfig load_from_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        TRELLIS_LOG_DEBUG("config file {} not found, using defaults", path.string());
        AppConfig config{};
        config.config_path = path;
        return config;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError(fmt::format("failed to open {}", path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    AppConfig config = parse_document(buffer.str(), path.string());
    config.config_path = path;
    return config;
}

} // namespace trellis::config
