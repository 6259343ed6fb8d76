#include "core/input.h"

#include <algorithm>
#include <cmath>

namespace crt
{
const char* KeyName(Key key)
{
    static const char* kNames[] = {
        "A", "B", "C", "D", "E", "F", "G", "H", "I", "J", "K", "L", "M", "N", "O", "P", "Q", "R", "S",
        "T", "U", "V", "W", "X", "Y", "Z",
        "0", "1", "2", "3", "4", "5", "6", "7", "8", "9",
        "Left", "Right", "Up", "Down",
        "Home", "End", "PageUp", "PageDown", "Insert", "Delete",
        "Escape", "Return", "Space", "Tab", "Backspace",
        "F1", "F2", "F3", "F4", "F5", "F6", "F7", "F8", "F9", "F10", "F11", "F12",
        "Numpad0", "Numpad1", "Numpad2", "Numpad3", "Numpad4", "Numpad5", "Numpad6", "Numpad7", "Numpad8",
        "Numpad9",
        "NumpadEnter", "NumpadAdd", "NumpadSubtract", "NumpadMultiply", "NumpadDivide", "NumpadDecimal",
        "Minus", "Equals", "Comma", "Period", "Slash", "Semicolon", "Apostrophe", "LeftBracket",
        "RightBracket", "Backslash", "Grave",
    };
    const std::size_t idx = (std::size_t)key;
    if (idx >= sizeof(kNames) / sizeof(kNames[0]))
        return "?";
    return kNames[idx];
}

bool InputSnapshot::IsKeyDown(Key k) const
{
    return std::find(keys_down.begin(), keys_down.end(), k) != keys_down.end();
}

void InputCollector::OnKeyDown(Key key, const Modifiers& mods)
{
    m_mods = mods;
    m_pressed = key;
    if (std::find(m_held.begin(), m_held.end(), key) == m_held.end())
        m_held.push_back(key);
}

void InputCollector::OnKeyUp(Key key, const Modifiers& mods)
{
    m_mods = mods;
    m_held.erase(std::remove(m_held.begin(), m_held.end(), key), m_held.end());
}

void InputCollector::OnPointerMoved(int x, int y)
{
    m_mouse_x = x;
    m_mouse_y = y;
}

void InputCollector::OnLeftButton(bool down)
{
    if (down && !m_button_down)
        m_clicked = true;
    m_button_down = down;
}

InputSnapshot InputCollector::Take(double frame_ms)
{
    InputSnapshot snap;
    snap.mouse_x = m_mouse_x;
    snap.mouse_y = m_mouse_y;

    if (m_interval_ms > 0.0)
    {
        m_accum_ms += std::max(0.0, frame_ms);
        if (m_accum_ms <= m_interval_ms)
            return snap;
        m_accum_ms = 0.0;
    }

    snap.key = m_pressed;
    snap.keys_down = m_held;
    snap.left_click = m_clicked || m_button_down;
    snap.shift = m_mods.shift;
    snap.control = m_mods.control;
    snap.alt = m_mods.alt;

    m_pressed.reset();
    m_clicked = false;
    return snap;
}

void MapPointerToLogical(float window_x, float window_y,
                         int window_w, int window_h,
                         int logical_w, int logical_h,
                         bool resize_scaling,
                         int& out_x, int& out_y)
{
    if (!resize_scaling || window_w <= 0 || window_h <= 0)
    {
        out_x = (int)std::floor(window_x);
        out_y = (int)std::floor(window_y);
        return;
    }
    out_x = (int)std::floor(window_x * (float)logical_w / (float)window_w);
    out_y = (int)std::floor(window_y * (float)logical_h / (float)window_h);
}
} // namespace crt
