#include "vk/native_session.h"

#include <cstdio>

namespace crt
{
std::unique_ptr<NativeSession> Init(int width_pixels, int height_pixels, const std::string& title,
                                    const InitHints& hints, Error& err)
{
    err.Clear();
    auto session = std::make_unique<NativeSession>(width_pixels, height_pixels);
    session->hints = hints;

    session->context = GpuContext::Create(width_pixels, height_pixels, title, hints, err);
    if (!session->context)
        return nullptr;

    VulkanBackend::Options opts;
    opts.vsync = hints.vsync;
    opts.resize_scaling = hints.resize_scaling;
    opts.debug_overlay = hints.debug_overlay;
    opts.logical_w = width_pixels;
    opts.logical_h = height_pixels;
    session->backend = std::make_unique<VulkanBackend>(*session->context, opts);
    if (!session->backend->Init(err))
    {
        std::fprintf(stderr, "[crtgrid] backend init failed: %s\n", FormatError(err).c_str());
        return nullptr;
    }
    if (!PrepareBackingBuffer(*session->backend, session->terminal, hints.resize_scaling, session->backing, err))
    {
        std::fprintf(stderr, "[crtgrid] backing buffer init failed: %s\n", FormatError(err).c_str());
        return nullptr;
    }
    return session;
}

bool Run(NativeSession& session, const TickFn& tick, Error& err)
{
    err.Clear();
    if (!session.backend)
        return err.Set(ErrorKind::Initialization, "context", "session has no backend");

    CompositorConfig cfg;
    cfg.frame_sleep_fps = session.hints.frame_sleep_time;
    cfg.resize_scaling = session.hints.resize_scaling;
    cfg.input_interval_ms = session.hints.input_interval_ms;

    Compositor compositor(*session.backend, cfg, session.backing);
    if (!compositor.Start(session.terminal, err))
    {
        std::fprintf(stderr, "[crtgrid] %s\n", FormatError(err).c_str());
        return false;
    }
    return compositor.Run(session.terminal, tick, err);
}
} // namespace crt
