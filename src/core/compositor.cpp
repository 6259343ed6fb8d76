#include "core/compositor.h"

#include <cmath>
#include <cstdio>

#include "core/terminal.h"

namespace crt
{
bool BackingBufferTracker::Ensure(RenderBackend& backend, int device_w, int device_h, bool& out_rebuilt, Error& err)
{
    out_rebuilt = false;
    err.Clear();
    if (device_w <= 0 || device_h <= 0)
        return true; // minimized: keep the current buffer
    if (device_w == m_w && device_h == m_h)
        return true;
    if (!backend.RebuildBackingBuffer(device_w, device_h, err))
        return false;
    m_w = device_w;
    m_h = device_h;
    ++m_rebuilds;
    out_rebuilt = true;
    return true;
}

bool PrepareBackingBuffer(RenderBackend& backend, const Terminal& term, bool resize_scaling,
                          BackingBufferTracker& tracker, Error& err)
{
    int dw = 0, dh = 0;
    Compositor::ComputeDeviceSize(term, resize_scaling, backend.ScaleFactor(), dw, dh);
    bool rebuilt = false;
    if (!tracker.Ensure(backend, dw, dh, rebuilt, err))
    {
        if (err.kind == ErrorKind::None)
            err.Set(ErrorKind::Initialization, "framebuffer", "backing buffer creation failed");
        return false;
    }
    return true;
}

Compositor::Compositor(RenderBackend& backend, const CompositorConfig& config)
    : m_backend(backend)
    , m_config(config)
    , m_frame_wait_s(ConvertFpsToWait(config.frame_sleep_fps))
{
    m_input.SetSampleInterval(config.input_interval_ms);
}

Compositor::Compositor(RenderBackend& backend, const CompositorConfig& config, const BackingBufferTracker& prepared)
    : Compositor(backend, config)
{
    m_backing = prepared;
}

void Compositor::ComputeDeviceSize(const Terminal& term, bool resize_scaling, float scale, int& out_w, int& out_h)
{
    const int lw = resize_scaling ? term.OriginalWidthPixels() : term.WidthPixels();
    const int lh = resize_scaling ? term.OriginalHeightPixels() : term.HeightPixels();
    const float s = (scale > 0.0f) ? scale : 1.0f;
    out_w = (int)std::lround((double)lw * (double)s);
    out_h = (int)std::lround((double)lh * (double)s);
}

bool Compositor::Start(Terminal& term, Error& err)
{
    m_scale = m_backend.ScaleFactor();
    if (!PrepareBackingBuffer(m_backend, term, m_config.resize_scaling, m_backing, err))
        return false;
    m_started = true;
    return true;
}

bool Compositor::ApplySurfaceEvents(Terminal& term, const SurfaceEvents& ev, bool& out_rebuilt, Error& err)
{
    out_rebuilt = false;
    if (!ev.resized && !ev.scale_changed)
        return true;

    if (ev.resized && !m_config.resize_scaling)
        term.SetLogicalSize(ev.logical_w, ev.logical_h);
    if (ev.scale_changed && ev.scale > 0.0f)
        m_scale = ev.scale;

    int dw = 0, dh = 0;
    ComputeDeviceSize(term, m_config.resize_scaling, m_scale, dw, dh);
    return m_backing.Ensure(m_backend, dw, dh, out_rebuilt, err);
}

FrameStatus Compositor::RunFrame(Terminal& term, const TickFn& tick, Error& err)
{
    err.Clear();
    if (!m_started && !Start(term, err))
        return FrameStatus::Failed;

    // 1. Input capture.
    const double frame_ms = m_clock.Tick(m_backend.NowSeconds());
    term.frame_time_ms = m_clock.FrameTimeMs();
    term.fps = m_clock.Fps();

    SurfaceEvents surface;
    if (!m_backend.PumpEvents(m_input, surface, err))
        return FrameStatus::Failed;
    if (surface.quit_requested)
        term.quitting = true;
    term.input = m_input.Take(frame_ms);

    // 2. Tick.
    if (tick)
        tick(term);

    // 3. Quit check.
    if (term.quitting)
        return FrameStatus::Quit;

    bool rebuilt = false;
    if (!ApplySurfaceEvents(term, surface, rebuilt, err))
        return FrameStatus::Failed;

    // 4. Vertex rebuild.
    term.RebuildDirtyGeometry();

    // 5-6. Render pass + post/present.
    FrameParams params;
    params.backing_rebuilt = rebuilt;
    params.post.scanlines = term.post_scanlines;
    params.post.burn = m_burn.Update(term.post_screenburn, term.screen_burn_color);
    params.post.device_w = m_backing.Width();
    params.post.device_h = m_backing.Height();
    if (!m_backend.RenderFrame(term, params, err))
    {
        if (err.Ok())
            err.Set(ErrorKind::DeviceLost, "frame", "render failed");
        return FrameStatus::Failed;
    }
    ++m_frames;

    // 7. Pacing.
    if (m_frame_wait_s && !m_backend.BlocksOnVsync())
    {
        const double start = m_clock.FrameStart();
        const double sleep_s = RemainingSleep(start, m_backend.NowSeconds(), *m_frame_wait_s);
        if (sleep_s > 0.0)
            m_backend.Sleep(sleep_s);
    }
    return FrameStatus::Continue;
}

bool Compositor::Run(Terminal& term, const TickFn& tick, Error& err)
{
    for (;;)
    {
        const FrameStatus st = RunFrame(term, tick, err);
        if (st == FrameStatus::Quit)
            return true;
        if (st == FrameStatus::Failed)
        {
            std::fprintf(stderr, "[crtgrid] frame loop terminated: %s\n", FormatError(err).c_str());
            return false;
        }
    }
}
} // namespace crt
