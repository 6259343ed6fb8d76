// Bridge to a third-party scene-graph / ECS host engine.
//
// The host owns windowing, rendering and its own tilemap plugins. Each frame the bridge
// publishes a plain snapshot of one dense console into a `SnapshotSlot`; the host's render
// plugins read tiles back through the Resolve* helpers. Nothing here depends on host types.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "core/cell.h"
#include "core/color.h"
#include "core/errors.h"
#include "core/font.h"
#include "core/input.h"
#include "core/render_backend.h"

namespace crt
{
class Terminal;

// Default sampling interval for host input (ms).
constexpr double kHostInputIntervalMs = 50.0;

// Sprite drawn by the background tilemap (full block, tinted with the cell background).
constexpr std::size_t kBackgroundSprite = 219;

struct ConsoleSnapshot
{
    int               width = 0;
    int               height = 0;
    std::vector<Cell> cells; // row-major, row 0 at the top
};

// Single-producer resource slot the host render plugins read from.
class SnapshotSlot
{
public:
    void Publish(ConsoleSnapshot snapshot);

    bool HasSnapshot() const { return m_generation != 0; }
    const ConsoleSnapshot& Read() const { return m_snapshot; }

    // Incremented by every Publish (0 = nothing published yet).
    std::uint64_t Generation() const { return m_generation; }

private:
    ConsoleSnapshot m_snapshot;
    std::uint64_t   m_generation = 0;
};

// Filled by the host once per update before the frame runs.
struct HostInputState
{
    std::vector<Key> keys_down;
    bool             has_pointer = false;
    float            pointer_x = 0.0f;
    float            pointer_y = 0.0f;
    bool             left_button = false;
    Modifiers        mods;

    double delta_seconds = 0.0;
    bool   quit_requested = false;
};

class HostEngineBackend final : public RenderBackend
{
public:
    explicit HostEngineBackend(SnapshotSlot& slot);

    // Picks the dense console to publish. A second dense console is a ResourceLimit error;
    // sparse consoles are skipped (the host has no plugin for them).
    bool BridgeConsoles(const Terminal& term, Error& err);
    bool IsBridged() const { return m_bridged.has_value(); }
    std::optional<std::size_t> BridgedConsole() const { return m_bridged; }

    void SetFrameInput(const HostInputState& input) { m_frame_input = input; }

    // RenderBackend
    bool PumpEvents(InputCollector& input, SurfaceEvents& surface, Error& err) override;
    double NowSeconds() override { return m_clock_s; }
    float ScaleFactor() const override { return 1.0f; }
    bool RebuildBackingBuffer(int device_w, int device_h, Error& err) override;
    bool RenderFrame(Terminal& term, const FrameParams& params, Error& err) override;
    bool BlocksOnVsync() const override { return true; }
    void Sleep(double) override {}

    int TargetWidth() const { return m_target_w; }
    int TargetHeight() const { return m_target_h; }

private:
    SnapshotSlot&              m_slot;
    std::optional<std::size_t> m_bridged;
    bool                       m_bridge_attempted = false;
    std::size_t                m_bridged_layer_count = 0;

    HostInputState   m_frame_input;
    std::vector<Key> m_prev_keys;
    double           m_clock_s = 0.0;

    int m_target_w = 0;
    int m_target_h = 0;
};

// Host tilemap helpers. Tile coordinates use a bottom-left origin (host world space);
// they are flipped to the console's top-left row order. Out-of-range tiles yield nullopt.
std::optional<std::size_t> ResolveTileSprite(const ConsoleSnapshot& snap, int tile_x, int tile_y);
std::optional<RGB> ResolveTileTint(const ConsoleSnapshot& snap, int tile_x, int tile_y);
std::optional<RGB> ResolveBackgroundTint(const ConsoleSnapshot& snap, int tile_x, int tile_y);

struct SpriteRect
{
    int   x = 0;
    int   y = 0;
    int   w = 0;
    int   h = 0;
    float offset_x = 0.0f; // centers the sprite on its tile
    float offset_y = 0.0f;
};

struct SpriteSheetLayout
{
    int                     sheet_w = 0;
    int                     sheet_h = 0;
    std::vector<SpriteRect> sprites; // 256 entries, glyph order
};

SpriteSheetLayout BuildSpriteSheet(const Font& font);

struct Placement
{
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

// 2D camera centered on the logical window.
Placement ComputeCameraPlacement(int width_pixels, int height_pixels);

// Tilemap entity translation so tile (0,0) lands in the bottom-left corner of the camera.
Placement ComputeTilemapPlacement(int width_pixels, int height_pixels, const Font& font);
} // namespace crt
