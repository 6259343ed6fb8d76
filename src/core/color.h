#pragma once

#include <algorithm>
#include <cstdint>

namespace crt
{
// Linear 0..1 colour triple used for cell foreground/background.
struct RGB
{
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;

    static constexpr RGB White() { return RGB{1.0f, 1.0f, 1.0f}; }
    static constexpr RGB Black() { return RGB{0.0f, 0.0f, 0.0f}; }

    static constexpr RGB FromU8(std::uint8_t r8, std::uint8_t g8, std::uint8_t b8)
    {
        return RGB{(float)r8 / 255.0f, (float)g8 / 255.0f, (float)b8 / 255.0f};
    }

    // t is clamped to 0..1.
    static RGB Lerp(const RGB& a, const RGB& b, float t)
    {
        t = std::clamp(t, 0.0f, 1.0f);
        return RGB{a.r + (b.r - a.r) * t, a.g + (b.g - a.g) * t, a.b + (b.b - a.b) * t};
    }

    friend bool operator==(const RGB& a, const RGB& b) = default;
};
} // namespace crt
