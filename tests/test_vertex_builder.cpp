// File: tests/test_vertex_builder.cpp
// Purpose: Background/glyph batch generation and layer clip-space transforms.

#include <gtest/gtest.h>

#include "core/dense_console.h"
#include "core/font.h"
#include "core/sparse_console.h"
#include "core/vertex_builder.h"

using namespace crt;

TEST(VertexBuilder, DefaultDenseConsoleEmitsBackgroundOnly)
{
    DenseConsole con(80, 25);
    ConsoleGeometry geo;
    con.BuildVertices(geo);

    EXPECT_TRUE(geo.glyphs.Empty());
    EXPECT_EQ(geo.glyphs.indices.size(), 0u);
    EXPECT_EQ(geo.background.QuadCount(), 80u * 25u);
    EXPECT_EQ(geo.background.vertices.size(), 80u * 25u * 4u);
    EXPECT_EQ(geo.background.indices.size(), 80u * 25u * 6u);
}

TEST(VertexBuilder, SingleGlyphLandsAtBottomLeftRenderPosition)
{
    DenseConsole con(80, 25);
    const RGB red{1.0f, 0.0f, 0.0f};
    con.Set(0, 0, Cell{64, red, RGB::Black()});

    ConsoleGeometry geo;
    con.BuildVertices(geo);
    ASSERT_EQ(geo.glyphs.QuadCount(), 1u);

    // Row 0 is the top row: in bottom-left render space it spans y in [24, 25].
    const ConsoleVertex& bl = geo.glyphs.vertices[0];
    EXPECT_FLOAT_EQ(bl.x, 0.0f);
    EXPECT_FLOAT_EQ(bl.y, 24.0f);
    const ConsoleVertex& tr = geo.glyphs.vertices[2];
    EXPECT_FLOAT_EQ(tr.x, 1.0f);
    EXPECT_FLOAT_EQ(tr.y, 25.0f);

    // Atlas tile 64 = column 0, row 4 of the 16x16 sheet.
    const GlyphUv uv = Font::UvForGlyph(64);
    EXPECT_FLOAT_EQ(uv.u0, 0.0f);
    EXPECT_FLOAT_EQ(uv.v0, 4.0f / 16.0f);
    EXPECT_FLOAT_EQ(bl.u, uv.u0);
    EXPECT_FLOAT_EQ(bl.v, uv.v1);
    EXPECT_FLOAT_EQ(tr.u, uv.u1);
    EXPECT_FLOAT_EQ(tr.v, uv.v0);

    EXPECT_FLOAT_EQ(bl.r, 1.0f);
    EXPECT_FLOAT_EQ(bl.g, 0.0f);
    EXPECT_FLOAT_EQ(bl.b, 0.0f);
    EXPECT_FLOAT_EQ(bl.a, 1.0f);
}

TEST(VertexBuilder, QuadIndicesFormTwoTriangles)
{
    VertexBatch batch;
    batch.AddQuad(0, 0, 1, 1, 0, 0, 1, 1, RGB::White());
    batch.AddQuad(1, 0, 2, 1, 0, 0, 1, 1, RGB::White());
    const std::vector<std::uint32_t> expected = {0, 1, 2, 0, 2, 3, 4, 5, 6, 4, 6, 7};
    EXPECT_EQ(batch.indices, expected);
}

TEST(VertexBuilder, BackgroundColourComesFromCell)
{
    DenseConsole con(2, 1);
    const RGB blue{0.0f, 0.0f, 1.0f};
    con.SetBackground(1, 0, blue);
    ConsoleGeometry geo;
    con.BuildVertices(geo);
    ASSERT_EQ(geo.background.QuadCount(), 2u);
    const ConsoleVertex& v = geo.background.vertices[4];
    EXPECT_FLOAT_EQ(v.x, 1.0f);
    EXPECT_FLOAT_EQ(v.b, 1.0f);
    EXPECT_FLOAT_EQ(v.r, 0.0f);
}

TEST(VertexBuilder, SparseEmitsOnlyExistingEntries)
{
    SparseConsole con(80, 25);
    con.Set(10, 5, Cell{'A', RGB::White(), RGB::Black()});
    con.Set(11, 5, Cell{' ', RGB::White(), RGB::Black()});

    ConsoleGeometry geo;
    con.BuildVertices(geo);
    EXPECT_EQ(geo.background.QuadCount(), 2u);
    ASSERT_EQ(geo.glyphs.QuadCount(), 1u);
    EXPECT_FLOAT_EQ(geo.glyphs.vertices[0].x, 10.0f);
    EXPECT_FLOAT_EQ(geo.glyphs.vertices[0].y, 19.0f);
}

TEST(VertexBuilder, GlyphsAboveTheSheetWrap)
{
    const GlyphUv a = Font::UvForGlyph(65);
    const GlyphUv b = Font::UvForGlyph(65 + 256);
    EXPECT_FLOAT_EQ(a.u0, b.u0);
    EXPECT_FLOAT_EQ(a.v0, b.v0);
}

TEST(LayerTransform, FullViewportConsoleMapsToClipCorners)
{
    // 80x50 cells of 8x8 pixels in a 640x400 viewport.
    const LayerTransform t = ComputeLayerTransform(80, 50, 8.0f, 8.0f, 640.0f, 400.0f, 0.0f, 0.0f);
    auto clip_x = [&](float x) { return x * t.scale[0] + t.bias[0]; };
    auto clip_y = [&](float y) { return y * t.scale[1] + t.bias[1]; };

    EXPECT_FLOAT_EQ(clip_x(0.0f), -1.0f);
    EXPECT_FLOAT_EQ(clip_x(80.0f), 1.0f);
    // Bottom edge of the console (render y 0) is the bottom of the viewport (+1 in Vulkan).
    EXPECT_FLOAT_EQ(clip_y(0.0f), 1.0f);
    EXPECT_FLOAT_EQ(clip_y(50.0f), -1.0f);
}

TEST(LayerTransform, OffsetShiftsByWholeCells)
{
    const LayerTransform t = ComputeLayerTransform(10, 10, 8.0f, 8.0f, 160.0f, 160.0f, 2.0f, 1.0f);
    // Left edge moves right by 2 cells = 16 px = 0.2 clip units.
    EXPECT_FLOAT_EQ(0.0f * t.scale[0] + t.bias[0], -0.8f);
    // Top edge moves down by 1 cell = 8 px = 0.1 clip units.
    EXPECT_FLOAT_EQ(10.0f * t.scale[1] + t.bias[1], -0.9f);
}

TEST(LayerTransform, DegenerateInputsYieldIdentity)
{
    const LayerTransform t = ComputeLayerTransform(0, 10, 8.0f, 8.0f, 160.0f, 160.0f, 0.0f, 0.0f);
    EXPECT_FLOAT_EQ(t.scale[0], 1.0f);
    EXPECT_FLOAT_EQ(t.bias[1], 0.0f);
}
