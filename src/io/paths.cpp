#include "io/paths.h"

#include <cstdlib>
#include <filesystem>

namespace crt
{
static std::string EnvOrEmpty(const char* name)
{
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string();
}

std::string GetConfigDir()
{
    const std::string xdg = EnvOrEmpty("XDG_CONFIG_HOME");
    if (!xdg.empty())
        return xdg + "/crtgrid";

    const std::string home = EnvOrEmpty("HOME");
    if (!home.empty())
        return home + "/.config/crtgrid";

    return ".";
}

std::string ConfigPath(const std::string& relative)
{
    namespace fs = std::filesystem;
    if (relative.empty())
        return GetConfigDir();
    return (fs::path(GetConfigDir()) / relative).string();
}
} // namespace crt
