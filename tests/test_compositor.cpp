// File: tests/test_compositor.cpp
// Purpose: Frame loop ordering, backing-buffer lifecycle, pacing and failure handling,
//          driven through a scripted in-memory backend.

#include <gtest/gtest.h>

#include <deque>
#include <memory>
#include <vector>

#include "core/compositor.h"
#include "core/dense_console.h"
#include "core/terminal.h"

using namespace crt;

namespace
{
struct RebuildCall
{
    int w = 0;
    int h = 0;
};

class FakeBackend final : public RenderBackend
{
public:
    bool PumpEvents(InputCollector& input, SurfaceEvents& surface, Error& err) override
    {
        (void)err;
        ++pumps;
        if (!pending_keys.empty())
        {
            input.OnKeyDown(pending_keys.front(), {});
            pending_keys.pop_front();
        }
        if (!pending_surface.empty())
        {
            surface = pending_surface.front();
            pending_surface.pop_front();
        }
        return true;
    }

    double NowSeconds() override { return now; }
    float ScaleFactor() const override { return scale; }

    bool RebuildBackingBuffer(int device_w, int device_h, Error& err) override
    {
        rebuilds.push_back({device_w, device_h});
        if (fail_rebuild)
            return err.Set(ErrorKind::Initialization, "framebuffer", "vkCreateFramebuffer failed");
        return true;
    }

    bool RenderFrame(Terminal& term, const FrameParams& params, Error& err) override
    {
        (void)term;
        last_params = params;
        ++renders;
        if (fail_render)
            return false;
        if (lose_device)
            return err.Set(ErrorKind::DeviceLost, "device", "VK_ERROR_DEVICE_LOST");
        return true;
    }

    bool BlocksOnVsync() const override { return vsync; }

    void Sleep(double seconds) override
    {
        sleeps.push_back(seconds);
        now += seconds;
    }

    double now = 0.0;
    float  scale = 1.0f;
    bool   vsync = true;
    bool   fail_render = false;
    bool   lose_device = false;
    bool   fail_rebuild = false;

    int pumps = 0;
    int renders = 0;
    std::vector<RebuildCall>  rebuilds;
    std::vector<double>       sleeps;
    std::deque<Key>           pending_keys;
    std::deque<SurfaceEvents> pending_surface;
    FrameParams               last_params;
};

SurfaceEvents Resized(int w, int h)
{
    SurfaceEvents ev;
    ev.resized = true;
    ev.logical_w = w;
    ev.logical_h = h;
    return ev;
}

SurfaceEvents ScaleChanged(float s)
{
    SurfaceEvents ev;
    ev.scale_changed = true;
    ev.scale = s;
    return ev;
}

std::unique_ptr<Terminal> MakeTerminal()
{
    auto term = std::make_unique<Terminal>(640, 400);
    const std::size_t font = term->AddFont("terminal8x8.png", 8, 8);
    Error err;
    EXPECT_TRUE(term->AddConsole(std::make_unique<DenseConsole>(80, 50), font, err));
    return term;
}
} // namespace

TEST(Compositor, StartCreatesBackingBufferAtDeviceSize)
{
    FakeBackend backend;
    backend.scale = 2.0f;
    auto term = MakeTerminal();
    Compositor comp(backend, CompositorConfig{});
    Error err;
    ASSERT_TRUE(comp.Start(*term, err));
    ASSERT_EQ(backend.rebuilds.size(), 1u);
    EXPECT_EQ(backend.rebuilds[0].w, 1280);
    EXPECT_EQ(backend.rebuilds[0].h, 800);
}

TEST(Compositor, InitFailsWhenBackingBufferCannotBeBuilt)
{
    FakeBackend backend;
    backend.fail_rebuild = true;
    auto term = MakeTerminal();

    BackingBufferTracker backing;
    Error err;
    EXPECT_FALSE(PrepareBackingBuffer(backend, *term, true, backing, err));
    EXPECT_EQ(err.kind, ErrorKind::Initialization);
    EXPECT_EQ(err.resource, "framebuffer");
    EXPECT_EQ(backing.RebuildCount(), 0);
    EXPECT_EQ(backing.Width(), 0);
}

TEST(Compositor, PreparedBackingBufferIsAdoptedByStart)
{
    FakeBackend backend;
    backend.scale = 1.5f;
    auto term = MakeTerminal();

    BackingBufferTracker backing;
    Error err;
    ASSERT_TRUE(PrepareBackingBuffer(backend, *term, true, backing, err));
    ASSERT_EQ(backend.rebuilds.size(), 1u);
    EXPECT_EQ(backend.rebuilds[0].w, 960);
    EXPECT_EQ(backend.rebuilds[0].h, 600);

    Compositor comp(backend, CompositorConfig{}, backing);
    ASSERT_TRUE(comp.Start(*term, err));
    ASSERT_EQ(comp.RunFrame(*term, {}, err), FrameStatus::Continue);
    EXPECT_EQ(backend.rebuilds.size(), 1u);
    EXPECT_EQ(comp.Backing().Width(), 960);
    EXPECT_EQ(backend.last_params.post.device_w, 960);
}

TEST(Compositor, ResizeToSameDeviceSizeDoesNotReallocate)
{
    FakeBackend backend;
    auto term = MakeTerminal();
    CompositorConfig cfg;
    cfg.resize_scaling = true;
    Compositor comp(backend, cfg);

    backend.pending_surface.push_back(Resized(1024, 768));
    backend.pending_surface.push_back(Resized(1024, 768));
    Error err;
    for (int i = 0; i < 3; ++i)
        ASSERT_EQ(comp.RunFrame(*term, {}, err), FrameStatus::Continue) << FormatError(err);

    // Resize scaling keeps the original logical size, so only the initial buffer exists.
    EXPECT_EQ(backend.rebuilds.size(), 1u);
    EXPECT_EQ(comp.Backing().RebuildCount(), 1);
    EXPECT_EQ(term->WidthPixels(), 640);
}

TEST(Compositor, NonScalingResizeGrowsLogicalSizeOnce)
{
    FakeBackend backend;
    auto term = MakeTerminal();
    CompositorConfig cfg;
    cfg.resize_scaling = false;
    Compositor comp(backend, cfg);

    backend.pending_surface.push_back(Resized(800, 600));
    backend.pending_surface.push_back(Resized(800, 600));
    Error err;
    ASSERT_EQ(comp.RunFrame(*term, {}, err), FrameStatus::Continue);
    ASSERT_EQ(comp.RunFrame(*term, {}, err), FrameStatus::Continue);

    ASSERT_EQ(backend.rebuilds.size(), 2u);
    EXPECT_EQ(backend.rebuilds[1].w, 800);
    EXPECT_EQ(backend.rebuilds[1].h, 600);
    EXPECT_EQ(term->WidthPixels(), 800);
    EXPECT_EQ(term->OriginalWidthPixels(), 640);
    EXPECT_EQ(comp.Backing().Width(), 800);
}

TEST(Compositor, ScaleChangeRebuildsAndFlagsFrame)
{
    FakeBackend backend;
    auto term = MakeTerminal();
    Compositor comp(backend, CompositorConfig{});

    Error err;
    ASSERT_EQ(comp.RunFrame(*term, {}, err), FrameStatus::Continue);
    EXPECT_FALSE(backend.last_params.backing_rebuilt);

    backend.pending_surface.push_back(ScaleChanged(1.5f));
    ASSERT_EQ(comp.RunFrame(*term, {}, err), FrameStatus::Continue);
    EXPECT_TRUE(backend.last_params.backing_rebuilt);
    ASSERT_EQ(backend.rebuilds.size(), 2u);
    EXPECT_EQ(backend.rebuilds[1].w, 960);
    EXPECT_EQ(backend.rebuilds[1].h, 600);
    EXPECT_EQ(backend.last_params.post.device_w, 960);
}

TEST(Compositor, ZeroSizedSurfaceKeepsCurrentBuffer)
{
    FakeBackend backend;
    auto term = MakeTerminal();
    CompositorConfig cfg;
    cfg.resize_scaling = false;
    Compositor comp(backend, cfg);

    backend.pending_surface.push_back(Resized(0, 0));
    Error err;
    ASSERT_EQ(comp.RunFrame(*term, {}, err), FrameStatus::Continue);
    EXPECT_EQ(backend.rebuilds.size(), 1u);
    EXPECT_EQ(term->WidthPixels(), 640);
}

TEST(Compositor, QuitStopsBeforeRendering)
{
    FakeBackend backend;
    auto term = MakeTerminal();
    Compositor comp(backend, CompositorConfig{});

    int ticks = 0;
    const TickFn tick = [&](Terminal& t) {
        ++ticks;
        if (ticks == 3)
            t.Quit();
    };

    Error err;
    EXPECT_TRUE(comp.Run(*term, tick, err));
    EXPECT_EQ(ticks, 3);
    EXPECT_EQ(backend.renders, 2);
    EXPECT_EQ(comp.FrameCount(), 2u);
}

TEST(Compositor, PlatformQuitRequestEndsTheLoop)
{
    FakeBackend backend;
    auto term = MakeTerminal();
    Compositor comp(backend, CompositorConfig{});

    SurfaceEvents ev;
    ev.quit_requested = true;
    backend.pending_surface.push_back(ev);

    Error err;
    EXPECT_EQ(comp.RunFrame(*term, {}, err), FrameStatus::Quit);
    EXPECT_TRUE(term->quitting);
    EXPECT_EQ(backend.renders, 0);
}

TEST(Compositor, TickSeesInputCapturedThisFrame)
{
    FakeBackend backend;
    auto term = MakeTerminal();
    Compositor comp(backend, CompositorConfig{});
    backend.pending_keys.push_back(Key::Right);

    std::optional<Key> seen;
    Error err;
    ASSERT_EQ(comp.RunFrame(*term, [&](Terminal& t) { seen = t.input.key; }, err), FrameStatus::Continue);
    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(*seen, Key::Right);
}

TEST(Compositor, GeometryIsRebuiltOnlyForChangedConsoles)
{
    FakeBackend backend;
    auto term = MakeTerminal();
    Compositor comp(backend, CompositorConfig{});

    Error err;
    ASSERT_EQ(comp.RunFrame(*term, {}, err), FrameStatus::Continue);
    const ConsoleLayer& layer = term->Layer(0);
    EXPECT_FALSE(layer.NeedsRebuild());
    EXPECT_EQ(layer.geometry.background.QuadCount(), 80u * 50u);
    EXPECT_TRUE(layer.geometry.glyphs.Empty());

    ASSERT_EQ(comp.RunFrame(*term, [](Terminal& t) { t.Print(0, 0, "@"); }, err), FrameStatus::Continue);
    EXPECT_EQ(layer.geometry.glyphs.QuadCount(), 1u);
    EXPECT_EQ(term->RebuildDirtyGeometry(), 0u);
}

TEST(Compositor, RenderFailureWithoutDetailReportsDeviceLost)
{
    FakeBackend backend;
    backend.fail_render = true;
    auto term = MakeTerminal();
    Compositor comp(backend, CompositorConfig{});

    Error err;
    EXPECT_FALSE(comp.Run(*term, {}, err));
    EXPECT_EQ(err.kind, ErrorKind::DeviceLost);
    EXPECT_EQ(err.resource, "frame");
    EXPECT_EQ(backend.renders, 1);
}

TEST(Compositor, BackendErrorIsPropagated)
{
    FakeBackend backend;
    backend.lose_device = true;
    auto term = MakeTerminal();
    Compositor comp(backend, CompositorConfig{});

    Error err;
    EXPECT_EQ(comp.RunFrame(*term, {}, err), FrameStatus::Failed);
    EXPECT_EQ(err.kind, ErrorKind::DeviceLost);
    EXPECT_EQ(err.resource, "device");
}

TEST(Compositor, PacingSleepsOnlyWithoutVsync)
{
    auto term = MakeTerminal();
    CompositorConfig cfg;
    cfg.frame_sleep_fps = 10.0f;

    FakeBackend vsynced;
    vsynced.vsync = true;
    Compositor a(vsynced, cfg);
    Error err;
    ASSERT_EQ(a.RunFrame(*term, {}, err), FrameStatus::Continue);
    EXPECT_TRUE(vsynced.sleeps.empty());

    FakeBackend free_running;
    free_running.vsync = false;
    Compositor b(free_running, cfg);
    ASSERT_EQ(b.RunFrame(*term, {}, err), FrameStatus::Continue);
    ASSERT_EQ(free_running.sleeps.size(), 1u);
    EXPECT_NEAR(free_running.sleeps[0], 0.1, 1e-9);
}

TEST(Compositor, NoPacingWithoutTarget)
{
    FakeBackend backend;
    backend.vsync = false;
    auto term = MakeTerminal();
    Compositor comp(backend, CompositorConfig{});
    Error err;
    ASSERT_EQ(comp.RunFrame(*term, {}, err), FrameStatus::Continue);
    EXPECT_TRUE(backend.sleeps.empty());
}

TEST(Compositor, PostEffectsFollowTerminalToggles)
{
    FakeBackend backend;
    auto term = MakeTerminal();
    Compositor comp(backend, CompositorConfig{});
    term->post_scanlines = true;
    term->post_screenburn = true;

    Error err;
    ASSERT_EQ(comp.RunFrame(*term, {}, err), FrameStatus::Continue);
    EXPECT_TRUE(backend.last_params.post.scanlines);
    EXPECT_GT(backend.last_params.post.burn.g, 0.0f);
    EXPECT_FLOAT_EQ(backend.last_params.post.burn.r, 0.0f);
}

TEST(Compositor, DeviceSizeUsesOriginalSizeWhenScaling)
{
    Terminal term(640, 400);
    term.SetLogicalSize(1000, 1000);
    int w = 0;
    int h = 0;
    Compositor::ComputeDeviceSize(term, true, 2.0f, w, h);
    EXPECT_EQ(w, 1280);
    EXPECT_EQ(h, 800);
    Compositor::ComputeDeviceSize(term, false, 1.0f, w, h);
    EXPECT_EQ(w, 1000);
    EXPECT_EQ(h, 1000);
    Compositor::ComputeDeviceSize(term, false, 0.0f, w, h);
    EXPECT_EQ(w, 1000);
}
