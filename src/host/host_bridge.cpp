#include "host/host_bridge.h"

#include <algorithm>
#include <cstdio>
#include <utility>

#include "core/console.h"
#include "core/terminal.h"

namespace crt
{
void SnapshotSlot::Publish(ConsoleSnapshot snapshot)
{
    m_snapshot = std::move(snapshot);
    ++m_generation;
}

HostEngineBackend::HostEngineBackend(SnapshotSlot& slot)
    : m_slot(slot)
{
}

bool HostEngineBackend::BridgeConsoles(const Terminal& term, Error& err)
{
    err.Clear();
    m_bridge_attempted = true;
    m_bridged.reset();

    const auto& layers = term.Layers();
    m_bridged_layer_count = layers.size();
    for (std::size_t i = 0; i < layers.size(); ++i)
    {
        const ConsoleLayer& layer = layers[i];
        if (!layer.console || !layer.console->AsGridSource())
            continue;
        if (m_bridged)
        {
            std::fprintf(stderr, "[host] refusing to bridge console %zu: console %zu already bridged\n",
                         i, *m_bridged);
            m_bridged.reset();
            return err.Set(ErrorKind::ResourceLimit, "console",
                           "host engine back-end only supports one dense console");
        }
        m_bridged = i;
    }

    if (m_bridged)
    {
        const GridSize size = layers[*m_bridged].console->CharSize();
        std::fprintf(stderr, "[host] bridged console %zu (%dx%d)\n", *m_bridged, size.width, size.height);
    }
    return true;
}

bool HostEngineBackend::PumpEvents(InputCollector& input, SurfaceEvents& surface, Error& err)
{
    err.Clear();
    const HostInputState& in = m_frame_input;
    if (in.delta_seconds > 0.0)
        m_clock_s += in.delta_seconds;

    input.OnModifiers(in.mods);
    for (Key k : m_prev_keys)
    {
        if (std::find(in.keys_down.begin(), in.keys_down.end(), k) == in.keys_down.end())
            input.OnKeyUp(k, in.mods);
    }
    // Held keys re-register every update so they repeat at the sample interval.
    for (Key k : in.keys_down)
        input.OnKeyDown(k, in.mods);
    m_prev_keys = in.keys_down;

    if (in.has_pointer)
        input.OnPointerMoved((int)in.pointer_x, (int)in.pointer_y);
    input.OnLeftButton(in.left_button);

    surface.quit_requested = in.quit_requested;
    m_frame_input.quit_requested = false;
    return true;
}

bool HostEngineBackend::RebuildBackingBuffer(int device_w, int device_h, Error& err)
{
    // The host owns its render targets; only the size is tracked.
    err.Clear();
    m_target_w = device_w;
    m_target_h = device_h;
    return true;
}

bool HostEngineBackend::RenderFrame(Terminal& term, const FrameParams&, Error& err)
{
    err.Clear();
    // Consoles added after the first frame must pass the same one-dense-console check.
    const bool layers_changed = term.ConsoleCount() != m_bridged_layer_count;
    if ((!m_bridge_attempted || layers_changed) && !BridgeConsoles(term, err))
        return false;
    if (!m_bridged)
        return true;

    if (*m_bridged >= term.ConsoleCount() || !term.Layer(*m_bridged).console)
        return err.Set(ErrorKind::ResourceLimit, "console", "bridged console no longer exists");

    const GridSource* grid = term.Layer(*m_bridged).console->AsGridSource();
    if (!grid)
        return err.Set(ErrorKind::ResourceLimit, "console", "bridged console is not a dense grid");

    ConsoleSnapshot snap;
    const GridSize size = grid->Size();
    snap.width = size.width;
    snap.height = size.height;
    snap.cells = grid->Cells();
    m_slot.Publish(std::move(snap));
    return true;
}

static const Cell* CellAtTile(const ConsoleSnapshot& snap, int tile_x, int tile_y)
{
    if (tile_x < 0 || tile_y < 0 || tile_x >= snap.width || tile_y >= snap.height)
        return nullptr;
    const int row = (snap.height - 1) - tile_y;
    const std::size_t idx = (std::size_t)row * (std::size_t)snap.width + (std::size_t)tile_x;
    if (idx >= snap.cells.size())
        return nullptr;
    return &snap.cells[idx];
}

std::optional<std::size_t> ResolveTileSprite(const ConsoleSnapshot& snap, int tile_x, int tile_y)
{
    const Cell* c = CellAtTile(snap, tile_x, tile_y);
    if (!c)
        return std::nullopt;
    return (std::size_t)(c->glyph & 0xFF);
}

std::optional<RGB> ResolveTileTint(const ConsoleSnapshot& snap, int tile_x, int tile_y)
{
    const Cell* c = CellAtTile(snap, tile_x, tile_y);
    if (!c)
        return std::nullopt;
    return c->fg;
}

std::optional<RGB> ResolveBackgroundTint(const ConsoleSnapshot& snap, int tile_x, int tile_y)
{
    const Cell* c = CellAtTile(snap, tile_x, tile_y);
    if (!c)
        return std::nullopt;
    return c->bg;
}

SpriteSheetLayout BuildSpriteSheet(const Font& font)
{
    SpriteSheetLayout out;
    out.sheet_w = font.AtlasWidth();
    out.sheet_h = font.AtlasHeight();
    out.sprites.reserve((std::size_t)Font::kTilesPerRow * Font::kTileRows);

    const float ox = -(float)font.tile_w / 2.0f;
    const float oy = -(float)font.tile_h / 2.0f;
    for (int y = 0; y < Font::kTileRows; ++y)
    {
        for (int x = 0; x < Font::kTilesPerRow; ++x)
        {
            SpriteRect r;
            r.x = x * font.tile_w;
            r.y = y * font.tile_h;
            r.w = font.tile_w;
            r.h = font.tile_h;
            r.offset_x = ox;
            r.offset_y = oy;
            out.sprites.push_back(r);
        }
    }
    return out;
}

Placement ComputeCameraPlacement(int width_pixels, int height_pixels)
{
    Placement p;
    p.x = (float)width_pixels * 0.5f;
    p.y = (float)height_pixels * 0.5f;
    p.z = 1.0f;
    return p;
}

Placement ComputeTilemapPlacement(int width_pixels, int height_pixels, const Font& font)
{
    Placement p;
    p.x = (float)width_pixels * 0.5f + (float)font.tile_w / 2.0f;
    p.y = (float)height_pixels * 0.5f - (float)font.tile_h / 2.0f;
    p.z = 0.0f;
    return p;
}
} // namespace crt
