// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trellis/core/log.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include "trellis/core/common.h"

namespace trellis::log
{

static std::shared_ptr<spdlog::logger> s_logger;

void init(spdlog::level::level_enum level)
{
    if (!s_logger)
    {
        s_logger = spdlog::get("trellis");
    }
    if (!s_logger)
    {
        s_logger = spdlog::stdout_color_mt("trellis");
        s_logger->set_pattern("[%T] [%^%l%$] %v");
    }
    s_logger->set_level(level);

    s_logger->debug("trellis logging system initialized");
}

std::shared_ptr<spdlog::logger> get_logger()
{
    if (!s_logger)
    {
        init();
    }
    return s_logger;
}

void set_level(spdlog::level::level_enum level)
{
    get_logger()->set_level(level);
}

spdlog::level::level_enum parse_level(const std::string& value)
{
    const std::string lowered = to_lower(value);

    if (lowered == "trace") return spdlog::level::trace;
    if (lowered == "debug") return spdlog::level::debug;
    if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
    if (lowered == "error") return spdlog::level::err;
    if (lowered == "critical" || lowered == "fatal") return spdlog::level::critical;
    if (lowered == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace trellis::log
