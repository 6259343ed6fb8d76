// Fixed table of GLSL (Vulkan dialect) shader pairs compiled at initialization.
//
// Shaders are addressed by `ShaderId` (a stable index) for the lifetime of a session;
// there is no lookup by name on the render path.

#pragma once

#include <cstddef>
#include <cstdint>

namespace crt
{
enum class ConsoleKind : std::uint8_t;

enum class ShaderId : std::uint8_t
{
    ConsoleWithBg = 0,
    ConsoleNoBg,
    Backing,
    Scanlines,
    FancyConsole,
    SpriteConsole,
    Count,
};

constexpr std::size_t kShaderCount = (std::size_t)ShaderId::Count;

struct ShaderSource
{
    const char* name;
    const char* vertex;
    const char* fragment;
};

// Bumped whenever a source string changes in a way that affects pipeline interfaces.
constexpr int kShaderTableVersion = 1;

const ShaderSource& GetShaderSource(ShaderId id);

// Per-layer drawing style. Standard picks the shader from the console kind.
enum class LayerStyle : std::uint8_t
{
    Standard = 0,
    Glow,   // fancy_console: soft CRT glow around glyphs
    Sprite, // sprite_console: full-colour sprite sheet tinted by fg
};

ShaderId ShaderForConsole(ConsoleKind kind, LayerStyle style);

// False for console_no_bg (sparse overlays show the layers beneath) and the composite shaders.
bool ShaderDrawsBackground(ShaderId id);

// Push-constant blocks shared by the shader sources and the backends (std430 layout).
struct ConsolePushConstants
{
    float scale[2];
    float bias[2];
    float texel[2];   // 1 / atlas size in pixels
    float textured;   // 0 = background pass, 1 = glyph pass
    float pad;
};

struct CompositePushConstants
{
    float burn[4];    // rgb + enabled flag in w
    float screen[2];  // device pixels
    float scanlines;  // 0 = burn only, 1 = scanlines
    float pad;
};
} // namespace crt
