// Backend contract shared by the native GPU backend and the host-engine bridge.
//
// The compositor owns the frame loop; a backend only pumps platform events, (re)creates the
// backing buffer when asked, and renders/publishes the terminal's layers.

#pragma once

#include "core/errors.h"
#include "core/input.h"
#include "core/post_effects.h"

namespace crt
{
class Terminal;

// Surface changes observed while pumping events (zero/false when nothing changed).
struct SurfaceEvents
{
    bool  quit_requested = false;

    bool  resized = false;       // logical (window) size changed
    int   logical_w = 0;
    int   logical_h = 0;

    bool  scale_changed = false; // display scale factor changed
    float scale = 1.0f;
};

struct FrameParams
{
    PostEffectParams post;
    bool             backing_rebuilt = false;
};

class RenderBackend
{
public:
    virtual ~RenderBackend() = default;

    // Feeds pending platform events into `input` and reports surface changes.
    virtual bool PumpEvents(InputCollector& input, SurfaceEvents& surface, Error& err) = 0;

    // Monotonic time in seconds.
    virtual double NowSeconds() = 0;

    // Current display scale factor (device pixels per logical pixel).
    virtual float ScaleFactor() const = 0;

    // Replaces the backing buffer with one of the given device size.
    virtual bool RebuildBackingBuffer(int device_w, int device_h, Error& err) = 0;

    // Draws every layer into the backing buffer, composites and presents (or publishes).
    virtual bool RenderFrame(Terminal& term, const FrameParams& params, Error& err) = 0;

    // True when presenting already paces frames (vsync); the compositor then skips sleeping.
    virtual bool BlocksOnVsync() const = 0;

    // Pacing sleep (only called when BlocksOnVsync() is false).
    virtual void Sleep(double seconds) = 0;
};
} // namespace crt
