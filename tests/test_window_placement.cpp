// File: tests/test_window_placement.cpp
// Purpose: Fullscreen/centered placement against enumerated monitors.

#include <gtest/gtest.h>

#include "core/window_placement.h"

using namespace crt;

TEST(WindowPlacement, FullscreenWithoutMonitorFails)
{
    WindowPlacement out;
    Error err;
    EXPECT_FALSE(ResolveWindowPlacement(true, true, 640, 400, {}, out, err));
    EXPECT_EQ(err.kind, ErrorKind::NoMonitorFound);
    EXPECT_EQ(err.resource, "monitor");
    EXPECT_FALSE(out.fullscreen);
}

TEST(WindowPlacement, CentersTheDecoratedWindow)
{
    const std::vector<MonitorInfo> monitors = {{1, 0, 0, 1920, 1080}};
    WindowBorders borders;
    borders.top = 30;
    borders.left = 4;
    borders.bottom = 4;
    borders.right = 4;
    WindowPlacement out;
    Error err;
    ASSERT_TRUE(ResolveWindowPlacement(false, true, 640, 400, borders, monitors, out, err));
    ASSERT_TRUE(out.positioned);
    // Outer 648x434: margins 1272x646, client origin offset by the left/top borders.
    EXPECT_EQ(out.x, 636 + 4);
    EXPECT_EQ(out.y, 323 + 30);
}

TEST(WindowPlacement, BordersCanPushTheWindowOffTheMonitor)
{
    const std::vector<MonitorInfo> monitors = {{1, 0, 0, 644, 420}};
    WindowBorders borders;
    borders.top = 24;
    borders.left = 4;
    borders.right = 4;
    WindowPlacement out;
    Error err;
    ASSERT_TRUE(ResolveWindowPlacement(false, true, 640, 400, borders, monitors, out, err));
    EXPECT_FALSE(out.positioned);
    ASSERT_TRUE(ResolveWindowPlacement(false, true, 640, 400, monitors, out, err));
    EXPECT_TRUE(out.positioned);
}

TEST(WindowPlacement, FullscreenUsesFirstMonitor)
{
    const std::vector<MonitorInfo> monitors = {{7, 0, 0, 1920, 1080}, {9, 1920, 0, 1280, 1024}};
    WindowPlacement out;
    Error err;
    ASSERT_TRUE(ResolveWindowPlacement(true, false, 640, 400, monitors, out, err));
    EXPECT_TRUE(err.Ok());
    EXPECT_TRUE(out.fullscreen);
    EXPECT_EQ(out.fullscreen_monitor, 7);
}

TEST(WindowPlacement, CentersOnFirstMonitor)
{
    const std::vector<MonitorInfo> monitors = {{1, 100, 50, 1920, 1080}};
    WindowPlacement out;
    Error err;
    ASSERT_TRUE(ResolveWindowPlacement(false, true, 640, 400, monitors, out, err));
    EXPECT_TRUE(out.positioned);
    EXPECT_EQ(out.x, 100 + (1920 - 640) / 2);
    EXPECT_EQ(out.y, 50 + (1080 - 400) / 2);
}

TEST(WindowPlacement, CenteringIsSkippedWhenItCannotApply)
{
    WindowPlacement out;
    Error err;

    ASSERT_TRUE(ResolveWindowPlacement(false, true, 640, 400, {}, out, err));
    EXPECT_FALSE(out.positioned);

    const std::vector<MonitorInfo> small = {{1, 0, 0, 320, 200}};
    ASSERT_TRUE(ResolveWindowPlacement(false, true, 640, 400, small, out, err));
    EXPECT_FALSE(out.positioned);

    const std::vector<MonitorInfo> big = {{1, 0, 0, 1920, 1080}};
    ASSERT_TRUE(ResolveWindowPlacement(false, false, 640, 400, big, out, err));
    EXPECT_FALSE(out.positioned);
}
