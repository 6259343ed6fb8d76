#include "core/frame_pacing.h"

#include <algorithm>

namespace crt
{
std::optional<double> ConvertFpsToWait(std::optional<float> fps)
{
    if (!fps || *fps <= 0.0f)
        return std::nullopt;
    return 1.0 / (double)*fps;
}

double FrameClock::Tick(double now_s)
{
    if (m_last_s < 0.0)
    {
        m_last_s = now_s;
        return 0.0;
    }

    const double dt_s = std::max(0.0, now_s - m_last_s);
    m_last_s = now_s;
    m_frame_time_ms = dt_s * 1000.0;
    if (dt_s > 0.0)
    {
        // Light smoothing so the reported value does not flicker every frame.
        const double instant = 1.0 / dt_s;
        m_fps = (m_fps <= 0.0) ? instant : (m_fps * 0.9 + instant * 0.1);
    }
    return m_frame_time_ms;
}

double RemainingSleep(double frame_start_s, double now_s, double wait_s)
{
    const double elapsed = now_s - frame_start_s;
    return std::max(0.0, wait_s - elapsed);
}
} // namespace crt
