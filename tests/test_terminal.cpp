// File: tests/test_terminal.cpp
// Purpose: Session aggregate (fonts, layers, active console) and shader/error tables.

#include <gtest/gtest.h>

#include <cstring>
#include <memory>

#include "core/dense_console.h"
#include "core/errors.h"
#include "core/shader_table.h"
#include "core/sparse_console.h"
#include "core/terminal.h"

using namespace crt;

TEST(Terminal, ClampsSizes)
{
    Terminal term(0, -5);
    EXPECT_EQ(term.WidthPixels(), 1);
    EXPECT_EQ(term.HeightPixels(), 1);
    term.SetLogicalSize(320, 200);
    term.SetLogicalSize(0, 200);
    EXPECT_EQ(term.WidthPixels(), 320);
    EXPECT_EQ(term.OriginalWidthPixels(), 1);
}

TEST(Terminal, AddConsoleRequiresLoadedFont)
{
    Terminal term(640, 400);
    Error err;
    EXPECT_FALSE(term.AddConsole(std::make_unique<DenseConsole>(80, 50), 0, err));
    EXPECT_EQ(err.kind, ErrorKind::Initialization);
    EXPECT_EQ(err.resource, "font");
    EXPECT_EQ(term.ConsoleCount(), 0u);

    const std::size_t font = term.AddFont("terminal8x8.png", 8, 8);
    EXPECT_EQ(font, 0u);
    ASSERT_TRUE(term.AddConsole(std::make_unique<DenseConsole>(80, 50), font, err));
    EXPECT_TRUE(err.Ok());
    EXPECT_EQ(term.ConsoleCount(), 1u);
}

TEST(Terminal, RejectsNullConsole)
{
    Terminal term(640, 400);
    term.AddFont("terminal8x8.png", 8, 8);
    Error err;
    EXPECT_FALSE(term.AddConsole(nullptr, 0, err));
    EXPECT_EQ(err.resource, "console");
}

TEST(Terminal, FontTileSizeIsClamped)
{
    Terminal term(640, 400);
    const std::size_t idx = term.AddFont("x.png", 0, -3);
    EXPECT_EQ(term.GetFont(idx).tile_w, 1);
    EXPECT_EQ(term.GetFont(idx).tile_h, 1);
    EXPECT_FALSE(term.GetFont(idx).IsBound());
    EXPECT_EQ(term.GetFont(idx).AtlasWidth(), 16);
}

TEST(Terminal, ShortcutsTargetTheActiveConsole)
{
    Terminal term(640, 400);
    const std::size_t font = term.AddFont("terminal8x8.png", 8, 8);
    Error err;
    ASSERT_TRUE(term.AddConsole(std::make_unique<DenseConsole>(80, 50), font, err));
    ASSERT_TRUE(term.AddConsole(std::make_unique<SparseConsole>(80, 50), font, err));

    term.SetActiveConsole(1);
    term.Print(2, 3, "x");
    term.SetActiveConsole(7);
    EXPECT_EQ(term.GetActiveConsole(), 1u);

    EXPECT_EQ(term.Layer(1).console->Get(2, 3)->glyph, 'x');
    EXPECT_EQ(term.Layer(0).console->Get(2, 3)->glyph, 32);

    term.SetActiveConsole(0);
    term.Set(1, 1, Cell{'#', RGB::White(), RGB::Black()});
    EXPECT_EQ(term.Layer(0).console->Get(1, 1)->glyph, '#');
}

TEST(Terminal, ShortcutsWithoutConsolesAreHarmless)
{
    Terminal term(640, 400);
    term.Cls();
    term.Print(0, 0, "x");
    EXPECT_EQ(term.RebuildDirtyGeometry(), 0u);
}

TEST(Terminal, RebuildCountsDirtyLayers)
{
    Terminal term(640, 400);
    const std::size_t font = term.AddFont("terminal8x8.png", 8, 8);
    Error err;
    ASSERT_TRUE(term.AddConsole(std::make_unique<DenseConsole>(10, 10), font, err));
    ASSERT_TRUE(term.AddConsole(std::make_unique<SparseConsole>(10, 10), font, err));

    EXPECT_EQ(term.RebuildDirtyGeometry(), 2u);
    EXPECT_EQ(term.RebuildDirtyGeometry(), 0u);
    term.Layer(1).console->SetOffset(0.5f, 0.0f);
    EXPECT_EQ(term.RebuildDirtyGeometry(), 1u);
}

TEST(ShaderTable, PicksShaderFromKindAndStyle)
{
    EXPECT_EQ(ShaderForConsole(ConsoleKind::Dense, LayerStyle::Standard), ShaderId::ConsoleWithBg);
    EXPECT_EQ(ShaderForConsole(ConsoleKind::Sparse, LayerStyle::Standard), ShaderId::ConsoleNoBg);
    EXPECT_EQ(ShaderForConsole(ConsoleKind::Dense, LayerStyle::Glow), ShaderId::FancyConsole);
    EXPECT_EQ(ShaderForConsole(ConsoleKind::Sparse, LayerStyle::Sprite), ShaderId::SpriteConsole);
}

TEST(ShaderTable, OnlyBackgroundShadersDrawBackgroundQuads)
{
    EXPECT_TRUE(ShaderDrawsBackground(ShaderId::ConsoleWithBg));
    EXPECT_TRUE(ShaderDrawsBackground(ShaderId::FancyConsole));
    EXPECT_TRUE(ShaderDrawsBackground(ShaderId::SpriteConsole));
    EXPECT_FALSE(ShaderDrawsBackground(ShaderId::ConsoleNoBg));
    EXPECT_FALSE(ShaderDrawsBackground(ShaderId::Backing));
    EXPECT_FALSE(ShaderDrawsBackground(ShaderId::Scanlines));

    // A plain sparse overlay never paints over the layers beneath it.
    EXPECT_FALSE(ShaderDrawsBackground(ShaderForConsole(ConsoleKind::Sparse, LayerStyle::Standard)));
}

TEST(ShaderTable, EverySlotHasSources)
{
    const char* expected[] = {"console_with_bg", "console_no_bg", "backing",
                              "scanlines", "fancy_console", "sprite_console"};
    ASSERT_EQ(kShaderCount, 6u);
    for (std::size_t i = 0; i < kShaderCount; ++i)
    {
        const ShaderSource& src = GetShaderSource((ShaderId)i);
        EXPECT_STREQ(src.name, expected[i]);
        ASSERT_NE(src.vertex, nullptr);
        ASSERT_NE(src.fragment, nullptr);
        EXPECT_EQ(std::strncmp(src.vertex, "#version 450", 12), 0);
        EXPECT_EQ(std::strncmp(src.fragment, "#version 450", 12), 0);
    }
}

TEST(ShaderTable, PushConstantBlocksFitMinimumLimit)
{
    EXPECT_EQ(sizeof(ConsolePushConstants), 32u);
    EXPECT_EQ(sizeof(CompositePushConstants), 32u);
}

TEST(Errors, FormatsKindResourceAndMessage)
{
    Error err;
    EXPECT_TRUE(err.Ok());
    EXPECT_EQ(FormatError(err), "ok");

    EXPECT_FALSE(err.Set(ErrorKind::NoMonitorFound, "monitor", "No available monitor found"));
    EXPECT_EQ(FormatError(err), "no monitor found (monitor): No available monitor found");

    err.Clear();
    EXPECT_TRUE(err.Ok());
    EXPECT_TRUE(err.resource.empty());
    EXPECT_STREQ(ErrorKindName(ErrorKind::ResourceLimit), "resource limit");
}
