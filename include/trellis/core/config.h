// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <spdlog/common.h>

namespace trellis::config {

enum class BackendKind {
    Software,
    Headless,
};

struct AppConfig {
    uint32_t window_width = 1280;
    uint32_t window_height = 720;
    spdlog::level::level_enum log_level = spdlog::level::info;
    BackendKind backend = BackendKind::Software;
    bool vsync = false;
    bool audit_shared_resources = true;
    unsigned frame_limit = 0; // 0 means run until stopped
    std::optional<unsigned> resize_at_frame;
    uint32_t resize_width = 0;
    uint32_t resize_height = 0;
    std::filesystem::path config_path;
};

/// Load a JSON config. A missing file yields the defaults; malformed content throws ConfigError.
AppConfig load_from_file(const std::filesystem::path& path);

/// Parse a JSON document held in memory, with the same rules as load_from_file.
AppConfig load_from_string(const std::string& text);

/// "software" or "headless" (case-insensitive); anything else throws ConfigError.
BackendKind parse_backend_kind(const std::string& value);

const char* backend_kind_name(BackendKind kind);

} // namespace trellis::config
