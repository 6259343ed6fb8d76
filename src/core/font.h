// Glyph-sheet font: a texture holding a 16x16 grid of fixed-size tiles.
//
// The texture itself is backend specific; `texture_id` is an opaque handle that
// the active backend fills in the first time the font is bound (nullptr until then).

#pragma once

#include <cstdint>
#include <string>

namespace crt
{
struct GlyphUv
{
    float u0 = 0.0f;
    float v0 = 0.0f; // top edge (texture space grows downward)
    float u1 = 0.0f;
    float v1 = 0.0f; // bottom edge
};

struct Font
{
    static constexpr int kTilesPerRow = 16;
    static constexpr int kTileRows = 16;

    std::string filename;
    int         tile_w = 8;
    int         tile_h = 8;
    void*       texture_id = nullptr;

    bool IsBound() const { return texture_id != nullptr; }

    int AtlasWidth() const { return tile_w * kTilesPerRow; }
    int AtlasHeight() const { return tile_h * kTileRows; }

    // Glyphs above 255 wrap into the 256-tile sheet.
    static GlyphUv UvForGlyph(std::uint16_t glyph)
    {
        const int g = glyph & 0xFF;
        const float col = (float)(g % kTilesPerRow);
        const float row = (float)(g / kTilesPerRow);
        GlyphUv uv;
        uv.u0 = col / (float)kTilesPerRow;
        uv.u1 = (col + 1.0f) / (float)kTilesPerRow;
        uv.v0 = row / (float)kTileRows;
        uv.v1 = (row + 1.0f) / (float)kTileRows;
        return uv;
    }
};
} // namespace crt
