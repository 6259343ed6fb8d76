// File: tests/test_host_bridge.cpp
// Purpose: Host-engine bridge: console bridging limits, snapshot publishing, tile lookups,
//          sprite sheet layout and input delivery through the frame loop.

#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "core/compositor.h"
#include "core/dense_console.h"
#include "core/sparse_console.h"
#include "core/terminal.h"
#include "host/host_bridge.h"

using namespace crt;

namespace
{
std::unique_ptr<Terminal> MakeTerminal(int dense_count, bool with_sparse)
{
    auto term = std::make_unique<Terminal>(640, 400);
    const std::size_t font = term->AddFont("terminal8x8.png", 8, 8);
    Error err;
    if (with_sparse)
        EXPECT_TRUE(term->AddConsole(std::make_unique<SparseConsole>(80, 50), font, err));
    for (int i = 0; i < dense_count; ++i)
        EXPECT_TRUE(term->AddConsole(std::make_unique<DenseConsole>(80, 50), font, err));
    return term;
}
} // namespace

TEST(HostBridge, SecondDenseConsoleIsAResourceLimit)
{
    auto term = MakeTerminal(2, false);
    SnapshotSlot slot;
    HostEngineBackend backend(slot);

    Error err;
    EXPECT_FALSE(backend.BridgeConsoles(*term, err));
    EXPECT_EQ(err.kind, ErrorKind::ResourceLimit);
    EXPECT_EQ(err.resource, "console");
    EXPECT_FALSE(backend.IsBridged());
}

TEST(HostBridge, FirstFrameFailsWhenBridgingFails)
{
    auto term = MakeTerminal(2, false);
    SnapshotSlot slot;
    HostEngineBackend backend(slot);
    Compositor comp(backend, CompositorConfig{});

    Error err;
    EXPECT_EQ(comp.RunFrame(*term, {}, err), FrameStatus::Failed);
    EXPECT_EQ(err.kind, ErrorKind::ResourceLimit);
    EXPECT_FALSE(slot.HasSnapshot());
}

TEST(HostBridge, DenseConsoleAddedAfterFirstFrameFails)
{
    auto term = MakeTerminal(1, false);
    SnapshotSlot slot;
    HostEngineBackend backend(slot);
    Compositor comp(backend, CompositorConfig{});

    Error err;
    ASSERT_EQ(comp.RunFrame(*term, {}, err), FrameStatus::Continue);
    ASSERT_TRUE(backend.IsBridged());

    ASSERT_TRUE(term->AddConsole(std::make_unique<DenseConsole>(40, 25), 0, err));
    EXPECT_EQ(comp.RunFrame(*term, {}, err), FrameStatus::Failed);
    EXPECT_EQ(err.kind, ErrorKind::ResourceLimit);
    EXPECT_EQ(err.resource, "console");
    EXPECT_FALSE(backend.IsBridged());
}

TEST(HostBridge, SparseConsoleAddedLaterKeepsTheBridge)
{
    auto term = MakeTerminal(1, false);
    SnapshotSlot slot;
    HostEngineBackend backend(slot);
    Compositor comp(backend, CompositorConfig{});

    Error err;
    ASSERT_EQ(comp.RunFrame(*term, {}, err), FrameStatus::Continue);
    ASSERT_TRUE(term->AddConsole(std::make_unique<SparseConsole>(80, 50), 0, err));
    ASSERT_EQ(comp.RunFrame(*term, {}, err), FrameStatus::Continue);
    ASSERT_TRUE(backend.BridgedConsole().has_value());
    EXPECT_EQ(*backend.BridgedConsole(), 0u);
}

TEST(HostBridge, SkipsSparseConsoles)
{
    auto term = MakeTerminal(1, true);
    SnapshotSlot slot;
    HostEngineBackend backend(slot);

    Error err;
    ASSERT_TRUE(backend.BridgeConsoles(*term, err));
    ASSERT_TRUE(backend.BridgedConsole().has_value());
    EXPECT_EQ(*backend.BridgedConsole(), 1u);
}

TEST(HostBridge, NoDenseConsoleMeansNothingPublished)
{
    auto term = MakeTerminal(0, true);
    SnapshotSlot slot;
    HostEngineBackend backend(slot);
    Compositor comp(backend, CompositorConfig{});

    Error err;
    ASSERT_EQ(comp.RunFrame(*term, {}, err), FrameStatus::Continue);
    EXPECT_FALSE(backend.IsBridged());
    EXPECT_FALSE(slot.HasSnapshot());
}

TEST(HostBridge, PublishesSnapshotEveryFrame)
{
    auto term = MakeTerminal(1, false);
    SnapshotSlot slot;
    HostEngineBackend backend(slot);
    Compositor comp(backend, CompositorConfig{});

    Error err;
    ASSERT_EQ(comp.RunFrame(*term, [](Terminal& t) { t.Print(0, 0, "A"); }, err), FrameStatus::Continue);
    ASSERT_TRUE(slot.HasSnapshot());
    EXPECT_EQ(slot.Generation(), 1u);
    EXPECT_EQ(slot.Read().width, 80);
    EXPECT_EQ(slot.Read().height, 50);
    EXPECT_EQ(slot.Read().cells.size(), 80u * 50u);
    EXPECT_EQ(slot.Read().cells[0].glyph, 'A');

    ASSERT_EQ(comp.RunFrame(*term, {}, err), FrameStatus::Continue);
    EXPECT_EQ(slot.Generation(), 2u);

    // Host targets follow the logical size at scale 1.
    EXPECT_EQ(backend.TargetWidth(), 640);
    EXPECT_EQ(backend.TargetHeight(), 400);
}

TEST(HostBridge, TileLookupsFlipRows)
{
    ConsoleSnapshot snap;
    snap.width = 3;
    snap.height = 2;
    snap.cells.resize(6);
    const RGB red{1.0f, 0.0f, 0.0f};
    const RGB blue{0.0f, 0.0f, 1.0f};
    snap.cells[0] = Cell{'T', red, blue};           // top-left
    snap.cells[3] = Cell{'B' + 256, blue, red};     // bottom-left

    ASSERT_TRUE(ResolveTileSprite(snap, 0, 1).has_value());
    EXPECT_EQ(*ResolveTileSprite(snap, 0, 1), (std::size_t)'T');
    EXPECT_EQ(*ResolveTileTint(snap, 0, 1), red);
    EXPECT_EQ(*ResolveBackgroundTint(snap, 0, 1), blue);

    EXPECT_EQ(*ResolveTileSprite(snap, 0, 0), (std::size_t)'B');
    EXPECT_EQ(*ResolveTileTint(snap, 0, 0), blue);

    EXPECT_FALSE(ResolveTileSprite(snap, 3, 0).has_value());
    EXPECT_FALSE(ResolveTileTint(snap, 0, 2).has_value());
    EXPECT_FALSE(ResolveBackgroundTint(snap, -1, 0).has_value());
}

TEST(HostBridge, TileLookupsToleratesShortSnapshot)
{
    ConsoleSnapshot snap;
    snap.width = 4;
    snap.height = 4;
    EXPECT_FALSE(ResolveTileSprite(snap, 0, 0).has_value());
}

TEST(HostBridge, SpriteSheetCoversAllGlyphs)
{
    Font font;
    font.tile_w = 8;
    font.tile_h = 16;
    const SpriteSheetLayout sheet = BuildSpriteSheet(font);
    EXPECT_EQ(sheet.sheet_w, 128);
    EXPECT_EQ(sheet.sheet_h, 256);
    ASSERT_EQ(sheet.sprites.size(), 256u);

    const SpriteRect& r = sheet.sprites[kBackgroundSprite];
    EXPECT_EQ(r.x, (219 % 16) * 8);
    EXPECT_EQ(r.y, (219 / 16) * 16);
    EXPECT_EQ(r.w, 8);
    EXPECT_EQ(r.h, 16);
    EXPECT_FLOAT_EQ(r.offset_x, -4.0f);
    EXPECT_FLOAT_EQ(r.offset_y, -8.0f);
}

TEST(HostBridge, CameraAndTilemapPlacement)
{
    Font font;
    const Placement cam = ComputeCameraPlacement(640, 400);
    EXPECT_FLOAT_EQ(cam.x, 320.0f);
    EXPECT_FLOAT_EQ(cam.y, 200.0f);
    EXPECT_FLOAT_EQ(cam.z, 1.0f);

    const Placement map = ComputeTilemapPlacement(640, 400, font);
    EXPECT_FLOAT_EQ(map.x, 324.0f);
    EXPECT_FLOAT_EQ(map.y, 196.0f);
    EXPECT_FLOAT_EQ(map.z, 0.0f);
}

TEST(HostBridge, InputArrivesAtTheSampleInterval)
{
    auto term = MakeTerminal(1, false);
    SnapshotSlot slot;
    HostEngineBackend backend(slot);
    CompositorConfig cfg;
    cfg.input_interval_ms = kHostInputIntervalMs;
    Compositor comp(backend, cfg);

    HostInputState in;
    in.keys_down = {Key::Up};
    in.delta_seconds = 0.02;
    backend.SetFrameInput(in);

    std::vector<bool> seen;
    const TickFn tick = [&](Terminal& t) { seen.push_back(t.input.key.has_value()); };
    Error err;
    for (int i = 0; i < 4; ++i)
        ASSERT_EQ(comp.RunFrame(*term, tick, err), FrameStatus::Continue);

    // 0, 20, 40 ms accumulated: held back. 60 ms: delivered.
    const std::vector<bool> expected = {false, false, false, true};
    EXPECT_EQ(seen, expected);
    EXPECT_NEAR(backend.NowSeconds(), 0.08, 1e-9);
}

TEST(HostBridge, QuitRequestIsConsumedOnce)
{
    auto term = MakeTerminal(1, false);
    SnapshotSlot slot;
    HostEngineBackend backend(slot);
    HostInputState in;
    in.quit_requested = true;
    backend.SetFrameInput(in);

    InputCollector input;
    SurfaceEvents first;
    SurfaceEvents second;
    Error err;
    ASSERT_TRUE(backend.PumpEvents(input, first, err));
    ASSERT_TRUE(backend.PumpEvents(input, second, err));
    EXPECT_TRUE(first.quit_requested);
    EXPECT_FALSE(second.quit_requested);
}

TEST(HostBridge, ReleasedKeysLeaveTheHeldSet)
{
    SnapshotSlot slot;
    HostEngineBackend backend(slot);
    InputCollector input;
    SurfaceEvents surface;
    Error err;

    HostInputState in;
    in.keys_down = {Key::A, Key::B};
    in.has_pointer = true;
    in.pointer_x = 33.7f;
    in.pointer_y = 12.2f;
    backend.SetFrameInput(in);
    ASSERT_TRUE(backend.PumpEvents(input, surface, err));
    InputSnapshot snap = input.Take(16.0);
    EXPECT_TRUE(snap.IsKeyDown(Key::A));
    EXPECT_TRUE(snap.IsKeyDown(Key::B));
    EXPECT_EQ(snap.mouse_x, 33);
    EXPECT_EQ(snap.mouse_y, 12);

    in.keys_down = {Key::B};
    backend.SetFrameInput(in);
    ASSERT_TRUE(backend.PumpEvents(input, surface, err));
    snap = input.Take(16.0);
    EXPECT_FALSE(snap.IsKeyDown(Key::A));
    EXPECT_TRUE(snap.IsKeyDown(Key::B));
}
