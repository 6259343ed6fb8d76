#include "core/post_effects.h"

namespace crt
{
const RGB& ScreenBurn::Update(bool enabled, const RGB& target)
{
    m_current = RGB::Lerp(m_current, enabled ? target : RGB::Black(), kRate);
    return m_current;
}
} // namespace crt
