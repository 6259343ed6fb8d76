#pragma once

#include <optional>

namespace crt
{
// Seconds to wait per frame for a frames-per-second target.
// Missing or non-positive targets disable pacing.
std::optional<double> ConvertFpsToWait(std::optional<float> fps);

// Frame time / fps bookkeeping, fed with monotonic timestamps in seconds.
class FrameClock
{
public:
    // Returns the duration of the frame that just ended, in milliseconds.
    double Tick(double now_s);

    double FrameTimeMs() const { return m_frame_time_ms; }
    double Fps() const { return m_fps; }

    // Start of the current frame (seconds), or a negative value before the first tick.
    double FrameStart() const { return m_last_s; }

private:
    double m_last_s = -1.0;
    double m_frame_time_ms = 0.0;
    double m_fps = 0.0;
};

// Remaining time to sleep so that a frame started at `frame_start_s` lasts `wait_s`.
double RemainingSleep(double frame_start_s, double now_s, double wait_s);
} // namespace crt
