// Console: a logical character grid rendered as one compositing layer.
//
// The interface is deliberately narrow (size, set/get, clear, vertex build). Backends that
// need direct access to a full grid (host-engine bridging) ask for `AsGridSource()`, which
// only the dense variant implements.

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "core/cell.h"
#include "core/vertex_builder.h"

namespace crt
{
enum class ConsoleKind : std::uint8_t
{
    Dense = 0,
    Sparse = 1,
};

struct GridSize
{
    int width = 0;
    int height = 0;

    friend bool operator==(const GridSize& a, const GridSize& b) = default;
};

// Read access to a full row-major grid (row 0 at the top).
class GridSource
{
public:
    virtual ~GridSource() = default;
    virtual GridSize Size() const = 0;
    virtual const std::vector<Cell>& Cells() const = 0;
};

class Console
{
public:
    virtual ~Console() = default;

    virtual ConsoleKind Kind() const = 0;

    // Constant for the console's lifetime.
    virtual GridSize CharSize() const = 0;

    // Writes outside [0,width) x [0,height) are ignored.
    virtual void Set(int x, int y, const Cell& cell) = 0;
    virtual std::optional<Cell> Get(int x, int y) const = 0;

    // Dense: every cell back to default. Sparse: removes every entry.
    virtual void Cls() = 0;

    virtual void BuildVertices(ConsoleGeometry& out) const = 0;

    virtual const GridSource* AsGridSource() const { return nullptr; }

    // Bumped by every mutation; the compositor rebuilds geometry when it changes.
    std::uint64_t Revision() const { return m_revision; }

    // Layer offset in cells (fractional offsets are allowed).
    float OffsetX() const { return m_offset_x; }
    float OffsetY() const { return m_offset_y; }
    void SetOffset(float x, float y)
    {
        m_offset_x = x;
        m_offset_y = y;
        Touch();
    }

    // Convenience writers built on Set(). Text is treated as bytes (CP437 glyph indices).
    void Print(int x, int y, std::string_view text);
    void PrintColor(int x, int y, const RGB& fg, const RGB& bg, std::string_view text);

    // Replaces only the background of an existing (or default) cell.
    void SetBackground(int x, int y, const RGB& bg);

protected:
    void Touch() { ++m_revision; }

    static bool InBounds(const GridSize& size, int x, int y)
    {
        return x >= 0 && y >= 0 && x < size.width && y < size.height;
    }

private:
    std::uint64_t m_revision = 1;
    float m_offset_x = 0.0f;
    float m_offset_y = 0.0f;
};
} // namespace crt
