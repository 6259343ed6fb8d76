// Window placement resolution (fullscreen / centered), independent of the windowing API.

#pragma once

#include <string>
#include <vector>

#include "core/errors.h"

namespace crt
{
struct MonitorInfo
{
    int id = 0;
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
};

struct WindowPlacement
{
    bool fullscreen = false;
    int  fullscreen_monitor = 0; // MonitorInfo::id

    bool positioned = false;     // false: leave it to the window manager
    int  x = 0;
    int  y = 0;
};

// Decoration sizes around the client area, as reported by the window manager.
struct WindowBorders
{
    int top = 0;
    int left = 0;
    int bottom = 0;
    int right = 0;
};

// - fullscreen with no monitor: fails with NoMonitorFound
// - centered (non-fullscreen): the outer window (client + borders) is placed at
//   (monitor - outer) / 2 on the first monitor; x/y are the client-area origin.
//   Skipped silently when there is no monitor metadata or the window is larger than the monitor
bool ResolveWindowPlacement(bool fullscreen,
                            bool centered,
                            int client_w,
                            int client_h,
                            const WindowBorders& borders,
                            const std::vector<MonitorInfo>& monitors,
                            WindowPlacement& out,
                            Error& err);

// Same, before the window exists and its borders are known.
bool ResolveWindowPlacement(bool fullscreen,
                            bool centered,
                            int client_w,
                            int client_h,
                            const std::vector<MonitorInfo>& monitors,
                            WindowPlacement& out,
                            Error& err);
} // namespace crt
