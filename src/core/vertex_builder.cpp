#include "core/vertex_builder.h"

#include "core/font.h"

namespace crt
{
void VertexBatch::AddQuad(float x0, float y0, float x1, float y1,
                          float u0, float v0, float u1, float v1,
                          const RGB& colour)
{
    const std::uint32_t base = (std::uint32_t)vertices.size();
    // bottom-left, bottom-right, top-right, top-left
    vertices.push_back(ConsoleVertex{x0, y0, u0, v1, colour.r, colour.g, colour.b, 1.0f});
    vertices.push_back(ConsoleVertex{x1, y0, u1, v1, colour.r, colour.g, colour.b, 1.0f});
    vertices.push_back(ConsoleVertex{x1, y1, u1, v0, colour.r, colour.g, colour.b, 1.0f});
    vertices.push_back(ConsoleVertex{x0, y1, u0, v0, colour.r, colour.g, colour.b, 1.0f});
    indices.push_back(base + 0);
    indices.push_back(base + 1);
    indices.push_back(base + 2);
    indices.push_back(base + 0);
    indices.push_back(base + 2);
    indices.push_back(base + 3);
}

namespace
{
void EmitCell(int x, int y, int height, const Cell& cell, ConsoleGeometry& out)
{
    const float x0 = (float)x;
    const float y0 = (float)(height - 1 - y);
    // Background quads sample nothing; uv is pinned to tile 0's corner.
    out.background.AddQuad(x0, y0, x0 + 1.0f, y0 + 1.0f, 0.0f, 0.0f, 0.0f, 0.0f, cell.bg);
    if (cell.IsBlank())
        return;
    const GlyphUv uv = Font::UvForGlyph(cell.glyph);
    out.glyphs.AddQuad(x0, y0, x0 + 1.0f, y0 + 1.0f, uv.u0, uv.v0, uv.u1, uv.v1, cell.fg);
}
} // namespace

void BuildDenseGeometry(int width, int height, const std::vector<Cell>& cells, ConsoleGeometry& out)
{
    out.Clear();
    if (width <= 0 || height <= 0 || cells.size() < (std::size_t)width * (std::size_t)height)
        return;

    out.background.Reserve((std::size_t)width * (std::size_t)height);
    for (int y = 0; y < height; ++y)
    {
        for (int x = 0; x < width; ++x)
            EmitCell(x, y, height, cells[(std::size_t)y * (std::size_t)width + (std::size_t)x], out);
    }
}

void BuildSparseGeometry(int width, int height, const std::vector<SparseEntry>& entries, ConsoleGeometry& out)
{
    out.Clear();
    if (width <= 0 || height <= 0)
        return;

    out.background.Reserve(entries.size());
    out.glyphs.Reserve(entries.size());
    for (const SparseEntry& e : entries)
        EmitCell(e.x, e.y, height, e.cell, out);
}

LayerTransform ComputeLayerTransform(int grid_w, int grid_h,
                                     float cell_w, float cell_h,
                                     float viewport_w, float viewport_h,
                                     float offset_x, float offset_y)
{
    LayerTransform t;
    if (grid_w <= 0 || grid_h <= 0 || viewport_w <= 0.0f || viewport_h <= 0.0f)
        return t;

    // x: pixel = (pos + offset) * cell_w, left edge of the viewport at -1.
    t.scale[0] = 2.0f * cell_w / viewport_w;
    t.bias[0] = 2.0f * offset_x * cell_w / viewport_w - 1.0f;

    // y: pos is measured from the console's bottom edge; the console's top edge sits at
    // offset_y cells below the top of the viewport.
    //   pixel_from_top = (grid_h - pos + offset_y) * cell_h
    t.scale[1] = -2.0f * cell_h / viewport_h;
    t.bias[1] = 2.0f * ((float)grid_h + offset_y) * cell_h / viewport_h - 1.0f;
    return t;
}
} // namespace crt
