// Per-frame input snapshot.
//
// Platform layers feed raw events into an `InputCollector` between frames; the frame loop
// calls `Take()` once at frame start and hands the resulting immutable snapshot to the tick.

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace crt
{
enum class Key : std::uint16_t
{
    A, B, C, D, E, F, G, H, I, J, K, L, M, N, O, P, Q, R, S, T, U, V, W, X, Y, Z,
    Num0, Num1, Num2, Num3, Num4, Num5, Num6, Num7, Num8, Num9,
    Left, Right, Up, Down,
    Home, End, PageUp, PageDown, Insert, Delete,
    Escape, Return, Space, Tab, Backspace,
    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
    Numpad0, Numpad1, Numpad2, Numpad3, Numpad4, Numpad5, Numpad6, Numpad7, Numpad8, Numpad9,
    NumpadEnter, NumpadAdd, NumpadSubtract, NumpadMultiply, NumpadDivide, NumpadDecimal,
    Minus, Equals, Comma, Period, Slash, Semicolon, Apostrophe, LeftBracket, RightBracket, Backslash, Grave,
};

const char* KeyName(Key key);

struct InputSnapshot
{
    // Last key pressed this frame (if several went down, the last event wins).
    std::optional<Key> key;
    // Every key currently held.
    std::vector<Key> keys_down;

    // Pointer position in logical pixels.
    int  mouse_x = 0;
    int  mouse_y = 0;
    bool left_click = false;

    bool shift = false;
    bool control = false;
    bool alt = false;

    bool IsKeyDown(Key k) const;
};

struct Modifiers
{
    bool shift = false;
    bool control = false;
    bool alt = false;
};

class InputCollector
{
public:
    void OnKeyDown(Key key, const Modifiers& mods);
    void OnKeyUp(Key key, const Modifiers& mods);
    void OnModifiers(const Modifiers& mods) { m_mods = mods; }
    void OnPointerMoved(int x, int y);
    void OnLeftButton(bool down);

    // Minimum accumulated time between samples (0 = sample every frame).
    void SetSampleInterval(double ms) { m_interval_ms = ms; }
    double SampleInterval() const { return m_interval_ms; }

    // Builds the snapshot for the frame that just started.
    // `frame_ms` is the duration of the previous frame, used for rate limiting. When the
    // interval has not elapsed yet the snapshot carries no key/click (pointer position is
    // kept) and pending presses stay queued for the next sample.
    InputSnapshot Take(double frame_ms);

private:
    std::optional<Key> m_pressed;     // last key-down since the previous sample
    std::vector<Key>   m_held;
    bool               m_clicked = false;
    bool               m_button_down = false;
    int                m_mouse_x = 0;
    int                m_mouse_y = 0;
    Modifiers          m_mods;

    double m_interval_ms = 0.0;
    double m_accum_ms = 0.0;
};

// Maps a window-space pointer position into the session's logical pixel space.
// With resize scaling enabled the whole picture is stretched to the window, so the
// position is rescaled from the current window size to the original logical size.
void MapPointerToLogical(float window_x, float window_y,
                         int window_w, int window_h,
                         int logical_w, int logical_h,
                         bool resize_scaling,
                         int& out_x, int& out_y);
} // namespace crt
