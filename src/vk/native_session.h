// Native entry points: `crt::Init()` builds window + GPU context + backend + terminal
// session, `crt::Run()` drives the frame loop until the session quits.

#pragma once

#include <memory>
#include <string>

#include "core/compositor.h"
#include "core/errors.h"
#include "core/init_hints.h"
#include "core/terminal.h"
#include "vk/gpu_context.h"
#include "vk/vulkan_backend.h"

namespace crt
{
struct NativeSession
{
    NativeSession(int width_pixels, int height_pixels)
        : terminal(width_pixels, height_pixels)
    {
    }

    InitHints hints;

    // Declaration order is teardown order in reverse: backend before context.
    std::unique_ptr<GpuContext>    context;
    std::unique_ptr<VulkanBackend> backend;
    Terminal                       terminal;

    // Backing buffer built by Init(); Run() hands it to the compositor.
    BackingBufferTracker backing;
};

// Creates the window, GPU context, backend and backing buffer.
// Fails with Initialization (context/shader/framebuffer) or NoMonitorFound.
std::unique_ptr<NativeSession> Init(int width_pixels, int height_pixels, const std::string& title,
                                    const InitHints& hints, Error& err);

// Returns true once quitting is observed; false when a frame fails (device loss, ...).
bool Run(NativeSession& session, const TickFn& tick, Error& err);
} // namespace crt
