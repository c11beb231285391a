// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace trellis::log {

/**
 * @brief Initialize the logging system
 *
 * @param level Log level (trace, debug, info, warn, error, critical)
 */
void init(spdlog::level::level_enum level = spdlog::level::info);

/**
 * @brief Get the default logger, initializing it on first use
 *
 * @return std::shared_ptr<spdlog::logger> The logger instance
 */
std::shared_ptr<spdlog::logger> get_logger();

/// Change the level of an already initialized logger.
void set_level(spdlog::level::level_enum level);

/// Map a level name ("debug", "Warning", "fatal", ...) to a spdlog level; unknown names map to info.
spdlog::level::level_enum parse_level(const std::string& value);

} // namespace trellis::log

// Convenience macros
#define TRELLIS_LOG_TRACE(...) ::trellis::log::get_logger()->trace(__VA_ARGS__)
#define TRELLIS_LOG_DEBUG(...) ::trellis::log::get_logger()->debug(__VA_ARGS__)
#define TRELLIS_LOG_INFO(...)  ::trellis::log::get_logger()->info(__VA_ARGS__)
#define TRELLIS_LOG_WARN(...)  ::trellis::log::get_logger()->warn(__VA_ARGS__)
#define TRELLIS_LOG_ERROR(...) ::trellis::log::get_logger()->error(__VA_ARGS__)
#define TRELLIS_LOG_CRITICAL(...) ::trellis::log::get_logger()->critical(__VA_ARGS__)
