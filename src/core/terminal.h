// Terminal session: the aggregate the application manipulates every frame.
//
// Owns the console layers (bottom to top), the fonts they draw with, the latest input
// snapshot, timing and post-effect toggles. Backends never own consoles; they read the
// layers (and their cached geometry) while rendering.

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "core/color.h"
#include "core/console.h"
#include "core/errors.h"
#include "core/font.h"
#include "core/input.h"
#include "core/shader_table.h"
#include "core/vertex_builder.h"

namespace crt
{
struct ConsoleLayer
{
    std::unique_ptr<Console> console;
    std::size_t              font_index = 0;
    LayerStyle               style = LayerStyle::Standard;

    // Cached vertex batches; valid when built_revision == console->Revision().
    ConsoleGeometry geometry;
    std::uint64_t   built_revision = 0;

    bool NeedsRebuild() const { return !console || built_revision != console->Revision(); }
};

class Terminal
{
public:
    Terminal(int width_pixels, int height_pixels);

    // Logical window size (follows resizes unless resize scaling is on).
    int WidthPixels() const { return m_width_pixels; }
    int HeightPixels() const { return m_height_pixels; }
    int OriginalWidthPixels() const { return m_original_width_pixels; }
    int OriginalHeightPixels() const { return m_original_height_pixels; }
    void SetLogicalSize(int width_pixels, int height_pixels);

    // Fonts ---------------------------------------------------------------
    std::size_t AddFont(std::string filename, int tile_w, int tile_h);
    std::size_t FontCount() const { return m_fonts.size(); }
    Font& GetFont(std::size_t index) { return m_fonts[index]; }
    const Font& GetFont(std::size_t index) const { return m_fonts[index]; }

    // Consoles ------------------------------------------------------------
    // Fails (Initialization, resource "font") when font_index does not name a loaded font.
    bool AddConsole(std::unique_ptr<Console> console, std::size_t font_index, Error& err);
    std::size_t ConsoleCount() const { return m_layers.size(); }

    ConsoleLayer& Layer(std::size_t index) { return m_layers[index]; }
    const ConsoleLayer& Layer(std::size_t index) const { return m_layers[index]; }
    std::vector<ConsoleLayer>& Layers() { return m_layers; }
    const std::vector<ConsoleLayer>& Layers() const { return m_layers; }

    void SetLayerStyle(std::size_t index, LayerStyle style);

    std::size_t GetActiveConsole() const { return m_active_console; }
    // Out-of-range indices are ignored.
    void SetActiveConsole(std::size_t index);
    // Requires at least one console.
    Console& Active() { return *m_layers[m_active_console].console; }

    // Active-console shortcuts.
    void Cls();
    void Print(int x, int y, std::string_view text);
    void PrintColor(int x, int y, const RGB& fg, const RGB& bg, std::string_view text);
    void Set(int x, int y, const Cell& cell);

    // Rebuilds vertex batches for every console whose content changed.
    // Returns the number of layers rebuilt.
    std::size_t RebuildDirtyGeometry();

    // Per-frame state -----------------------------------------------------
    InputSnapshot input;
    double        fps = 0.0;
    double        frame_time_ms = 0.0;

    bool quitting = false;
    void Quit() { quitting = true; }

    bool post_scanlines = false;
    bool post_screenburn = false;
    RGB  screen_burn_color = RGB{0.0f, 1.0f, 1.0f};

private:
    int m_width_pixels = 0;
    int m_height_pixels = 0;
    int m_original_width_pixels = 0;
    int m_original_height_pixels = 0;

    std::vector<Font>         m_fonts;
    std::vector<ConsoleLayer> m_layers;
    std::size_t               m_active_console = 0;
};
} // namespace crt
