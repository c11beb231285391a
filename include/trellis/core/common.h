// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cctype>
#include <string>

// Silence unused parameter warnings in node overrides that ignore part of their input
#define TRELLIS_UNUSED(x) ((void)(x))

namespace trellis
{

// ASCII lowercase, for case-insensitive names in config files and on the command line
inline std::string to_lower(std::string value)
{
    for (char& c : value)
    {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return value;
}

} // namespace trellis
