// File: tests/test_consoles.cpp
// Purpose: Dense and sparse console storage semantics (bounds, last-write-wins, revisions).

#include <gtest/gtest.h>

#include "core/dense_console.h"
#include "core/sparse_console.h"

using namespace crt;

namespace
{
const RGB kRed{1.0f, 0.0f, 0.0f};
const RGB kBlue{0.0f, 0.0f, 1.0f};
} // namespace

TEST(DenseConsole, StartsWithDefaultCells)
{
    DenseConsole con(80, 25);
    EXPECT_EQ(con.Kind(), ConsoleKind::Dense);
    EXPECT_EQ(con.CharSize(), (GridSize{80, 25}));
    ASSERT_EQ(con.Cells().size(), 80u * 25u);
    for (const Cell& c : con.Cells())
    {
        EXPECT_EQ(c.glyph, 32);
        EXPECT_EQ(c.fg, RGB::White());
        EXPECT_EQ(c.bg, RGB::Black());
        EXPECT_TRUE(c.IsBlank());
    }
}

TEST(DenseConsole, CharSizeIsInvariantUnderWrites)
{
    DenseConsole con(40, 10);
    for (int i = 0; i < 5000; ++i)
        con.Set(i % 97 - 20, i % 31 - 5, Cell{(std::uint16_t)(i & 0xFF), kRed, kBlue});
    EXPECT_EQ(con.CharSize(), (GridSize{40, 10}));
    EXPECT_EQ(con.Cells().size(), 400u);
}

TEST(DenseConsole, OutOfRangeWritesDoNotTouchTheGrid)
{
    DenseConsole con(8, 4);
    con.Set(1, 1, Cell{'x', kRed, kBlue});
    const std::vector<Cell> before = con.Cells();
    const std::uint64_t rev = con.Revision();

    con.Set(-1, 0, Cell{'a', kRed, kBlue});
    con.Set(0, -1, Cell{'a', kRed, kBlue});
    con.Set(8, 0, Cell{'a', kRed, kBlue});
    con.Set(0, 4, Cell{'a', kRed, kBlue});
    con.Set(1000, 1000, Cell{'a', kRed, kBlue});

    EXPECT_EQ(con.Cells(), before);
    EXPECT_EQ(con.Revision(), rev);
    EXPECT_FALSE(con.Get(8, 0).has_value());
}

TEST(DenseConsole, WriteThenReadRoundTripsAndIsIdempotent)
{
    DenseConsole con(80, 25);
    const Cell c{64, kRed, RGB::Black()};
    con.Set(79, 24, c);
    ASSERT_TRUE(con.Get(79, 24).has_value());
    EXPECT_EQ(*con.Get(79, 24), c);
    EXPECT_EQ(con.Cells()[24 * 80 + 79], c);

    const std::uint64_t rev = con.Revision();
    con.Set(79, 24, c);
    EXPECT_EQ(con.Revision(), rev);
    EXPECT_EQ(*con.Get(79, 24), c);
}

TEST(DenseConsole, ClsRestoresDefaults)
{
    DenseConsole con(4, 4);
    con.Set(2, 2, Cell{'#', kRed, kBlue});
    con.Cls();
    EXPECT_EQ(*con.Get(2, 2), Cell{});
}

TEST(DenseConsole, ExposesGridSource)
{
    DenseConsole con(3, 2);
    const GridSource* grid = con.AsGridSource();
    ASSERT_NE(grid, nullptr);
    EXPECT_EQ(grid->Size(), (GridSize{3, 2}));
    EXPECT_EQ(grid->Cells().size(), 6u);
}

TEST(DenseConsole, PrintKeepsColoursAndClipsAtTheEdge)
{
    DenseConsole con(5, 1);
    con.SetBackground(3, 0, kBlue);
    con.Print(2, 0, "abcdef");
    EXPECT_EQ(con.Get(2, 0)->glyph, 'a');
    EXPECT_EQ(con.Get(3, 0)->glyph, 'b');
    EXPECT_EQ(con.Get(3, 0)->bg, kBlue);
    EXPECT_EQ(con.Get(4, 0)->glyph, 'c');
    EXPECT_EQ(con.Get(1, 0)->glyph, 32);
}

TEST(DenseConsole, PrintColorWritesFullCells)
{
    DenseConsole con(10, 2);
    con.PrintColor(0, 1, kRed, kBlue, "hi");
    EXPECT_EQ(*con.Get(0, 1), (Cell{'h', kRed, kBlue}));
    EXPECT_EQ(*con.Get(1, 1), (Cell{'i', kRed, kBlue}));
}

TEST(SparseConsole, LastWriteWinsWithOneEntryPerCoordinate)
{
    SparseConsole con(80, 25);
    EXPECT_EQ(con.Kind(), ConsoleKind::Sparse);
    con.Set(3, 4, Cell{'a', kRed, kBlue});
    con.Set(3, 4, Cell{'b', kBlue, kRed});

    ASSERT_EQ(con.Entries().size(), 1u);
    EXPECT_EQ(con.Entries()[0].x, 3);
    EXPECT_EQ(con.Entries()[0].y, 4);
    EXPECT_EQ(con.Entries()[0].cell, (Cell{'b', kBlue, kRed}));
    EXPECT_EQ(*con.Get(3, 4), (Cell{'b', kBlue, kRed}));
}

TEST(SparseConsole, IgnoresOutOfRangeWrites)
{
    SparseConsole con(10, 10);
    con.Set(-1, 0, Cell{});
    con.Set(10, 0, Cell{});
    con.Set(0, 10, Cell{});
    EXPECT_TRUE(con.Entries().empty());
    EXPECT_FALSE(con.Get(0, 0).has_value());
}

TEST(SparseConsole, KeepsInsertionOrder)
{
    SparseConsole con(10, 10);
    con.Set(5, 5, Cell{'1', kRed, kBlue});
    con.Set(1, 1, Cell{'2', kRed, kBlue});
    con.Set(5, 5, Cell{'3', kRed, kBlue});
    ASSERT_EQ(con.Entries().size(), 2u);
    EXPECT_EQ(con.Entries()[0].cell.glyph, '3');
    EXPECT_EQ(con.Entries()[1].cell.glyph, '2');
}

TEST(SparseConsole, ClsAndEraseRemoveEntries)
{
    SparseConsole con(10, 10);
    con.Set(1, 1, Cell{'a', kRed, kBlue});
    con.Set(2, 2, Cell{'b', kRed, kBlue});
    con.Erase(1, 1);
    ASSERT_EQ(con.Entries().size(), 1u);
    EXPECT_FALSE(con.Get(1, 1).has_value());

    const std::uint64_t rev = con.Revision();
    con.Cls();
    EXPECT_TRUE(con.Entries().empty());
    EXPECT_GT(con.Revision(), rev);
}

TEST(SparseConsole, IsNotBridgeable)
{
    SparseConsole con(10, 10);
    EXPECT_EQ(con.AsGridSource(), nullptr);
}
