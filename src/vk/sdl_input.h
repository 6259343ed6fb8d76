#pragma once

#include <SDL3/SDL.h>

#include <optional>

#include "core/input.h"

namespace crt
{
// SDL keycode -> crtgrid key (nullopt for keys with no mapping, including modifiers).
std::optional<Key> KeyFromSdl(SDL_Keycode key);

Modifiers ModifiersFromSdl(SDL_Keymod mod);
} // namespace crt
