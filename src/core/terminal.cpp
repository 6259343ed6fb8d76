#include "core/terminal.h"

#include <algorithm>
#include <utility>

namespace crt
{
Terminal::Terminal(int width_pixels, int height_pixels)
    : m_width_pixels(std::max(1, width_pixels))
    , m_height_pixels(std::max(1, height_pixels))
    , m_original_width_pixels(std::max(1, width_pixels))
    , m_original_height_pixels(std::max(1, height_pixels))
{
}

void Terminal::SetLogicalSize(int width_pixels, int height_pixels)
{
    if (width_pixels <= 0 || height_pixels <= 0)
        return;
    m_width_pixels = width_pixels;
    m_height_pixels = height_pixels;
}

std::size_t Terminal::AddFont(std::string filename, int tile_w, int tile_h)
{
    Font f;
    f.filename = std::move(filename);
    f.tile_w = std::max(1, tile_w);
    f.tile_h = std::max(1, tile_h);
    m_fonts.push_back(std::move(f));
    return m_fonts.size() - 1;
}

bool Terminal::AddConsole(std::unique_ptr<Console> console, std::size_t font_index, Error& err)
{
    err.Clear();
    if (!console)
        return err.Set(ErrorKind::Initialization, "console", "null console");
    if (font_index >= m_fonts.size())
    {
        return err.Set(ErrorKind::Initialization, "font",
                       "font index " + std::to_string(font_index) + " is not loaded");
    }

    ConsoleLayer layer;
    layer.console = std::move(console);
    layer.font_index = font_index;
    m_layers.push_back(std::move(layer));
    return true;
}

void Terminal::SetLayerStyle(std::size_t index, LayerStyle style)
{
    if (index < m_layers.size())
        m_layers[index].style = style;
}

void Terminal::SetActiveConsole(std::size_t index)
{
    if (index < m_layers.size())
        m_active_console = index;
}

void Terminal::Cls()
{
    if (!m_layers.empty())
        Active().Cls();
}

void Terminal::Print(int x, int y, std::string_view text)
{
    if (!m_layers.empty())
        Active().Print(x, y, text);
}

void Terminal::PrintColor(int x, int y, const RGB& fg, const RGB& bg, std::string_view text)
{
    if (!m_layers.empty())
        Active().PrintColor(x, y, fg, bg, text);
}

void Terminal::Set(int x, int y, const Cell& cell)
{
    if (!m_layers.empty())
        Active().Set(x, y, cell);
}

std::size_t Terminal::RebuildDirtyGeometry()
{
    std::size_t rebuilt = 0;
    for (ConsoleLayer& layer : m_layers)
    {
        if (!layer.console || !layer.NeedsRebuild())
            continue;
        layer.console->BuildVertices(layer.geometry);
        layer.built_revision = layer.console->Revision();
        ++rebuilt;
    }
    return rebuilt;
}
} // namespace crt
