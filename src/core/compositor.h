// Frame loop: input -> tick -> quit check -> vertex rebuild -> render -> present -> pacing.

#pragma once

#include <cstdint>
#include <functional>
#include <optional>

#include "core/errors.h"
#include "core/frame_pacing.h"
#include "core/input.h"
#include "core/post_effects.h"
#include "core/render_backend.h"

namespace crt
{
class Terminal;

// Application callback: mutates the session (console contents, active console, quitting).
using TickFn = std::function<void(Terminal&)>;

// Tracks the backing buffer's device size so identical sizes never reallocate.
class BackingBufferTracker
{
public:
    // Calls backend.RebuildBackingBuffer() only when the size differs from the current one.
    // `out_rebuilt` reports whether a new buffer was created.
    bool Ensure(RenderBackend& backend, int device_w, int device_h, bool& out_rebuilt, Error& err);

    int Width() const { return m_w; }
    int Height() const { return m_h; }
    int RebuildCount() const { return m_rebuilds; }

private:
    int m_w = 0;
    int m_h = 0;
    int m_rebuilds = 0;
};

// Builds the backing buffer for the session's current logical size times backend.ScaleFactor().
// Part of init: a failure here means the session never becomes runnable.
bool PrepareBackingBuffer(RenderBackend& backend, const Terminal& term, bool resize_scaling,
                          BackingBufferTracker& tracker, Error& err);

struct CompositorConfig
{
    // Frames-per-second target for the pacing sleep (none = no sleep).
    std::optional<float> frame_sleep_fps;
    // Stretch the original logical picture to the window instead of growing the logical size.
    bool resize_scaling = true;
    // Input sampling interval in ms (0 = every frame).
    double input_interval_ms = 0.0;
};

enum class FrameStatus
{
    Continue,
    Quit,   // quitting observed (terminal state)
    Failed, // unrecoverable error (device loss, render failure)
};

class Compositor
{
public:
    Compositor(RenderBackend& backend, const CompositorConfig& config);
    // Adopts a backing buffer already built by PrepareBackingBuffer().
    Compositor(RenderBackend& backend, const CompositorConfig& config, const BackingBufferTracker& prepared);

    // Picks up the scale factor and sizes the backing buffer, rebuilding only when the size
    // differs from the adopted one.
    bool Start(Terminal& term, Error& err);

    // One frame cycle. On Failed, `err` describes the error and the loop must stop.
    FrameStatus RunFrame(Terminal& term, const TickFn& tick, Error& err);

    // Runs frames until quitting is observed (returns true) or a frame fails (returns false).
    bool Run(Terminal& term, const TickFn& tick, Error& err);

    // Device pixel size for the current logical size and scale factor.
    static void ComputeDeviceSize(const Terminal& term, bool resize_scaling, float scale,
                                  int& out_w, int& out_h);

    const BackingBufferTracker& Backing() const { return m_backing; }
    const ScreenBurn& Burn() const { return m_burn; }
    InputCollector& Input() { return m_input; }
    std::uint64_t FrameCount() const { return m_frames; }

private:
    bool ApplySurfaceEvents(Terminal& term, const SurfaceEvents& ev, bool& out_rebuilt, Error& err);

    RenderBackend&        m_backend;
    CompositorConfig      m_config;
    std::optional<double> m_frame_wait_s;

    InputCollector       m_input;
    BackingBufferTracker m_backing;
    FrameClock           m_clock;
    ScreenBurn           m_burn;
    float                m_scale = 1.0f;
    bool                 m_started = false;
    std::uint64_t        m_frames = 0;
};
} // namespace crt
