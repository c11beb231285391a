// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trellis/core/time.h"

#include <algorithm>
#include <numeric>
#include <utility>

#include "trellis/core/log.h"

namespace trellis::time
{

using namespace std::chrono;

FrameTimer::FrameTimer() : m_last(Clock::now()) {}

double FrameTimer::tick()
{
    const auto now = Clock::now();
    m_delta_seconds = duration_cast<duration<double>>(now - m_last).count();
    m_last = now;

    if (m_frame_count == 0)
    {
        m_filtered_delta = std::min(m_delta_seconds, 1.0 / 60.0);
    }
    else
    {
        if (m_history.size() >= DT_FILTER_WIDTH)
        {
            m_history.pop_front();
        }
        m_history.push_back(m_delta_seconds);
        m_filtered_delta = std::accumulate(m_history.begin(), m_history.end(), 0.0) /
                           static_cast<double>(m_history.size());
    }

    ++m_frame_count;
    return m_delta_seconds;
}

ScopedTimer::ScopedTimer(std::string label) : m_label(std::move(label)), m_begin(Clock::now()) {}

ScopedTimer::~ScopedTimer()
{
    const auto end = Clock::now();
    const auto elapsed = duration_cast<duration<double, std::milli>>(end - m_begin).count();
    TRELLIS_LOG_DEBUG("[timer] {} took {:.3f} ms", m_label, elapsed);
}

} // namespace trellis::time
