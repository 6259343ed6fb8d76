#include "core/window_placement.h"

namespace crt
{
bool ResolveWindowPlacement(bool fullscreen,
                            bool centered,
                            int client_w,
                            int client_h,
                            const WindowBorders& borders,
                            const std::vector<MonitorInfo>& monitors,
                            WindowPlacement& out,
                            Error& err)
{
    out = WindowPlacement{};
    err.Clear();

    if (fullscreen)
    {
        if (monitors.empty())
            return err.Set(ErrorKind::NoMonitorFound, "monitor", "No available monitor found");
        out.fullscreen = true;
        out.fullscreen_monitor = monitors.front().id;
        return true;
    }

    if (!centered || monitors.empty())
        return true;

    const MonitorInfo& m = monitors.front();
    if (m.width <= 0 || m.height <= 0)
        return true;
    const int outer_w = client_w + borders.left + borders.right;
    const int outer_h = client_h + borders.top + borders.bottom;
    const int margin_w = m.width - outer_w;
    const int margin_h = m.height - outer_h;
    if (margin_w < 0 || margin_h < 0)
        return true;

    out.positioned = true;
    out.x = m.x + margin_w / 2 + borders.left;
    out.y = m.y + margin_h / 2 + borders.top;
    return true;
}

bool ResolveWindowPlacement(bool fullscreen,
                            bool centered,
                            int client_w,
                            int client_h,
                            const std::vector<MonitorInfo>& monitors,
                            WindowPlacement& out,
                            Error& err)
{
    return ResolveWindowPlacement(fullscreen, centered, client_w, client_h, WindowBorders{}, monitors, out, err);
}
} // namespace crt
