#pragma once

#include <string>

namespace crt
{
// Returns the crtgrid config directory:
//   $XDG_CONFIG_HOME/crtgrid, else $HOME/.config/crtgrid, else ".".
std::string GetConfigDir();

// Joins the config dir and a relative path within it.
// Example: ConfigPath("init_hints.json") -> "<config_dir>/init_hints.json"
std::string ConfigPath(const std::string& relative);
} // namespace crt
