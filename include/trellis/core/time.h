// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

namespace trellis::time {

using Clock = std::chrono::steady_clock;

/// Frame interval timer with a moving-average delta
class FrameTimer {
public:
    // Delta times are filtered over this many frames.
    static constexpr size_t DT_FILTER_WIDTH = 10;

    FrameTimer();

    /// Record a frame boundary; returns the raw interval in seconds.
    double tick();

    double delta_seconds() const { return m_delta_seconds; }

    /// Average of the last DT_FILTER_WIDTH intervals. The first interval is clamped to 1/60 s,
    /// since the first frame includes pipeline creation.
    double filtered_delta() const { return m_filtered_delta; }

    uint64_t frame_count() const { return m_frame_count; }

private:
    Clock::time_point m_last;
    double m_delta_seconds = 0.0;
    double m_filtered_delta = 0.0;
    uint64_t m_frame_count = 0;
    std::deque<double> m_history;
};

/// Scoped timer, logs the elapsed time at debug level on destruction
class ScopedTimer {
public:
    explicit ScopedTimer(std::string label);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string m_label;
    Clock::time_point m_begin;
};

} // namespace trellis::time
