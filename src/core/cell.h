#pragma once

#include <cstdint>

#include "core/color.h"

namespace crt
{
// One console cell: glyph index into a 16x16 atlas plus foreground/background.
struct Cell
{
    std::uint16_t glyph = 32;
    RGB           fg = RGB::White();
    RGB           bg = RGB::Black();

    // Blank glyphs (NUL and space) draw background only.
    bool IsBlank() const { return glyph == 0 || glyph == 32; }

    friend bool operator==(const Cell& a, const Cell& b) = default;
};

// Occupied cell of a sparse console.
struct SparseEntry
{
    int  x = 0;
    int  y = 0;
    Cell cell;
};
} // namespace crt
