// Console -> GPU primitive batches.
//
// Vertex positions are expressed in render-cell space with a bottom-left origin:
// console cell (x, y) (row 0 at the top) occupies [x, x+1] x [h-1-y, h-y].
// `ComputeLayerTransform()` maps that space to clip space for a given layer.

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/cell.h"
#include "core/color.h"

namespace crt
{
struct ConsoleVertex
{
    float x, y;
    float u, v;
    float r, g, b, a;
};

// Indexed quads: 4 vertices and 6 indices per quad.
struct VertexBatch
{
    std::vector<ConsoleVertex> vertices;
    std::vector<std::uint32_t> indices;

    std::size_t QuadCount() const { return vertices.size() / 4; }
    bool Empty() const { return vertices.empty(); }

    void Clear()
    {
        vertices.clear();
        indices.clear();
    }

    void Reserve(std::size_t quads)
    {
        vertices.reserve(quads * 4);
        indices.reserve(quads * 6);
    }

    // Axis-aligned quad from (x0,y0) to (x1,y1), uv rectangle (u0,v0)-(u1,v1) where v0 is
    // the texture row at y1 (the top edge in render space).
    void AddQuad(float x0, float y0, float x1, float y1,
                 float u0, float v0, float u1, float v1,
                 const RGB& colour);
};

// Background and glyph passes are drawn in that order with the same shader.
struct ConsoleGeometry
{
    VertexBatch background;
    VertexBatch glyphs;

    void Clear()
    {
        background.Clear();
        glyphs.Clear();
    }
};

// Dense: one background quad per cell, one glyph quad per non-blank cell.
void BuildDenseGeometry(int width, int height, const std::vector<Cell>& cells, ConsoleGeometry& out);

// Sparse: quads only for existing entries (blank glyphs emit background only).
void BuildSparseGeometry(int width, int height, const std::vector<SparseEntry>& entries, ConsoleGeometry& out);

// Clip-space mapping for one console layer: clip = pos * scale + bias.
struct LayerTransform
{
    float scale[2] = {1.0f, 1.0f};
    float bias[2] = {0.0f, 0.0f};
};

// - grid_w/grid_h: console size in cells
// - cell_w/cell_h: logical pixels per cell
// - viewport_w/viewport_h: logical pixel size of the target
// - offset_x/offset_y: console offset in cells (positive x = right, positive y = down)
// Clip space follows Vulkan (y = -1 at the top).
LayerTransform ComputeLayerTransform(int grid_w, int grid_h,
                                     float cell_w, float cell_h,
                                     float viewport_w, float viewport_h,
                                     float offset_x, float offset_y);
} // namespace crt
