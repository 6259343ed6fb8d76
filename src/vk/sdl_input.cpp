#include "vk/sdl_input.h"

namespace crt
{
std::optional<Key> KeyFromSdl(SDL_Keycode key)
{
    if (key >= SDLK_A && key <= SDLK_Z)
        return (Key)((int)Key::A + (int)(key - SDLK_A));
    if (key >= SDLK_0 && key <= SDLK_9)
        return (Key)((int)Key::Num0 + (int)(key - SDLK_0));

    switch (key)
    {
    case SDLK_LEFT:         return Key::Left;
    case SDLK_RIGHT:        return Key::Right;
    case SDLK_UP:           return Key::Up;
    case SDLK_DOWN:         return Key::Down;
    case SDLK_HOME:         return Key::Home;
    case SDLK_END:          return Key::End;
    case SDLK_PAGEUP:       return Key::PageUp;
    case SDLK_PAGEDOWN:     return Key::PageDown;
    case SDLK_INSERT:       return Key::Insert;
    case SDLK_DELETE:       return Key::Delete;
    case SDLK_ESCAPE:       return Key::Escape;
    case SDLK_RETURN:       return Key::Return;
    case SDLK_SPACE:        return Key::Space;
    case SDLK_TAB:          return Key::Tab;
    case SDLK_BACKSPACE:    return Key::Backspace;
    case SDLK_F1:           return Key::F1;
    case SDLK_F2:           return Key::F2;
    case SDLK_F3:           return Key::F3;
    case SDLK_F4:           return Key::F4;
    case SDLK_F5:           return Key::F5;
    case SDLK_F6:           return Key::F6;
    case SDLK_F7:           return Key::F7;
    case SDLK_F8:           return Key::F8;
    case SDLK_F9:           return Key::F9;
    case SDLK_F10:          return Key::F10;
    case SDLK_F11:          return Key::F11;
    case SDLK_F12:          return Key::F12;
    case SDLK_KP_0:         return Key::Numpad0;
    case SDLK_KP_1:         return Key::Numpad1;
    case SDLK_KP_2:         return Key::Numpad2;
    case SDLK_KP_3:         return Key::Numpad3;
    case SDLK_KP_4:         return Key::Numpad4;
    case SDLK_KP_5:         return Key::Numpad5;
    case SDLK_KP_6:         return Key::Numpad6;
    case SDLK_KP_7:         return Key::Numpad7;
    case SDLK_KP_8:         return Key::Numpad8;
    case SDLK_KP_9:         return Key::Numpad9;
    case SDLK_KP_ENTER:     return Key::NumpadEnter;
    case SDLK_KP_PLUS:      return Key::NumpadAdd;
    case SDLK_KP_MINUS:     return Key::NumpadSubtract;
    case SDLK_KP_MULTIPLY:  return Key::NumpadMultiply;
    case SDLK_KP_DIVIDE:    return Key::NumpadDivide;
    case SDLK_KP_PERIOD:    return Key::NumpadDecimal;
    case SDLK_MINUS:        return Key::Minus;
    case SDLK_EQUALS:       return Key::Equals;
    case SDLK_COMMA:        return Key::Comma;
    case SDLK_PERIOD:       return Key::Period;
    case SDLK_SLASH:        return Key::Slash;
    case SDLK_SEMICOLON:    return Key::Semicolon;
    case SDLK_APOSTROPHE:   return Key::Apostrophe;
    case SDLK_LEFTBRACKET:  return Key::LeftBracket;
    case SDLK_RIGHTBRACKET: return Key::RightBracket;
    case SDLK_BACKSLASH:    return Key::Backslash;
    case SDLK_GRAVE:        return Key::Grave;
    default:
        break;
    }
    return std::nullopt;
}

Modifiers ModifiersFromSdl(SDL_Keymod mod)
{
    Modifiers m;
    m.shift = (mod & SDL_KMOD_SHIFT) != 0;
    m.control = (mod & SDL_KMOD_CTRL) != 0;
    m.alt = (mod & SDL_KMOD_ALT) != 0;
    return m;
}
} // namespace crt
