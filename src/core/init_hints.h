// Initialization hints for `crt::Init()` (window, context and pacing options).

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace crt
{
struct WindowIcon
{
    std::vector<std::uint8_t> pixels; // RGBA8, row-major
    int width = 0;
    int height = 0;
};

// Graphics API feature selection (Vulkan instance API version).
struct GraphicsApiVersion
{
    int major = 1;
    int minor = 2;
};

struct InitHints
{
    bool allow_resize = true;
    bool vsync = true;
    bool fullscreen = false;
    bool centered = true;
    bool srgb = false;

    std::optional<WindowIcon> icon;
    // Loaded into `icon` at init when set and `icon` is empty.
    std::string icon_path;

    // Frames-per-second target for the pacing sleep (none = no sleep).
    std::optional<float> frame_sleep_time;

    // true: stretch the original logical picture to the window on resize.
    // false: the logical size follows the window and consoles keep their pixel size.
    bool resize_scaling = true;

    GraphicsApiVersion api_version;

    // Input sampling interval in milliseconds (0 = every frame).
    double input_interval_ms = 0.0;

    // Dear ImGui overlay with fps / frame time.
    bool debug_overlay = false;
};
} // namespace crt
