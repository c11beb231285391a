// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

namespace trellis
{

/**
 * @brief Base exception class for trellis errors
 */
class TrellisError : public std::runtime_error
{
public:
    explicit TrellisError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Configuration file errors
 */
class ConfigError : public TrellisError
{
public:
    explicit ConfigError(const std::string& message) : TrellisError("Config error: " + message) {}
};

} // namespace trellis
