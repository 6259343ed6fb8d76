// Final-composite effects: scanlines and screen burn.

#pragma once

#include "core/color.h"

namespace crt
{
// Persistent colour accumulator for the screen-burn tint.
// Enabled: moves toward the target hue each composite. Disabled: fades toward black.
class ScreenBurn
{
public:
    static constexpr float kRate = 0.05f;

    const RGB& Update(bool enabled, const RGB& target);

    const RGB& Current() const { return m_current; }
    void Reset() { m_current = RGB::Black(); }

private:
    RGB m_current = RGB::Black();
};

// Values checked once per final composite.
struct PostEffectParams
{
    bool  scanlines = false;
    RGB   burn = RGB::Black();
    int   device_w = 0;
    int   device_h = 0;
};
} // namespace crt
