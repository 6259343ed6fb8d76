#include "io/init_hints_json.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <limits>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace crt
{
static json ToJson(const InitHints& h)
{
    json j;
    j["schema_version"] = kInitHintsSchemaVersion;

    json win;
    win["allow_resize"] = h.allow_resize;
    win["fullscreen"] = h.fullscreen;
    win["centered"] = h.centered;
    if (!h.icon_path.empty())
        win["icon"] = h.icon_path;
    j["window"] = win;

    json gfx;
    gfx["vsync"] = h.vsync;
    gfx["srgb"] = h.srgb;
    gfx["api_version"] = {h.api_version.major, h.api_version.minor};
    gfx["resize_scaling"] = h.resize_scaling;
    j["graphics"] = gfx;

    json loop;
    if (h.frame_sleep_time)
        loop["fps"] = *h.frame_sleep_time;
    else
        loop["fps"] = nullptr;
    loop["input_interval_ms"] = h.input_interval_ms;
    loop["debug_overlay"] = h.debug_overlay;
    j["loop"] = loop;
    return j;
}

static void FromJson(const json& j, InitHints& out)
{
    // Defaults are already in out; only override what we recognize.
    if (j.contains("window") && j["window"].is_object())
    {
        const json& w = j["window"];
        if (w.contains("allow_resize") && w["allow_resize"].is_boolean()) out.allow_resize = w["allow_resize"].get<bool>();
        if (w.contains("fullscreen") && w["fullscreen"].is_boolean()) out.fullscreen = w["fullscreen"].get<bool>();
        if (w.contains("centered") && w["centered"].is_boolean()) out.centered = w["centered"].get<bool>();
        if (w.contains("icon") && w["icon"].is_string()) out.icon_path = w["icon"].get<std::string>();
    }

    if (j.contains("graphics") && j["graphics"].is_object())
    {
        const json& g = j["graphics"];
        if (g.contains("vsync") && g["vsync"].is_boolean()) out.vsync = g["vsync"].get<bool>();
        if (g.contains("srgb") && g["srgb"].is_boolean()) out.srgb = g["srgb"].get<bool>();
        if (g.contains("resize_scaling") && g["resize_scaling"].is_boolean())
            out.resize_scaling = g["resize_scaling"].get<bool>();
        if (g.contains("api_version") && g["api_version"].is_array() && g["api_version"].size() == 2 &&
            g["api_version"][0].is_number_integer() && g["api_version"][1].is_number_integer())
        {
            const int major = g["api_version"][0].get<int>();
            const int minor = g["api_version"][1].get<int>();
            if (major == 1 && minor >= 0 && minor <= 4)
            {
                out.api_version.major = major;
                out.api_version.minor = minor;
            }
        }
    }

    if (j.contains("loop") && j["loop"].is_object())
    {
        const json& l = j["loop"];
        if (l.contains("fps"))
        {
            if (l["fps"].is_null())
                out.frame_sleep_time.reset();
            else if (l["fps"].is_number() && l["fps"].get<double>() > 0.0)
            {
                const double fps = std::min(l["fps"].get<double>(), (double)std::numeric_limits<float>::max());
                out.frame_sleep_time = (float)fps;
            }
        }
        if (l.contains("input_interval_ms") && l["input_interval_ms"].is_number() &&
            l["input_interval_ms"].get<double>() >= 0.0)
            out.input_interval_ms = l["input_interval_ms"].get<double>();
        if (l.contains("debug_overlay") && l["debug_overlay"].is_boolean())
            out.debug_overlay = l["debug_overlay"].get<bool>();
    }
}

static bool ApplyParsed(const json& j, InitHints& out, std::string& err)
{
    if (!j.is_object())
    {
        err = "Init hints must be a JSON object.";
        return false;
    }

    // Basic schema check (but keep it forgiving).
    if (j.contains("schema_version") && j["schema_version"].is_number_integer())
    {
        const int ver = j["schema_version"].get<int>();
        if (ver != kInitHintsSchemaVersion)
            return true; // unknown schema: ignore file rather than failing startup
    }

    FromJson(j, out);
    return true;
}

bool ParseInitHints(const std::string& text, InitHints& out, std::string& err)
{
    err.clear();
    json j;
    try
    {
        j = json::parse(text);
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to parse init hints: ") + e.what();
        return false;
    }
    return ApplyParsed(j, out, err);
}

bool LoadInitHints(const std::string& path, InitHints& out, std::string& err)
{
    err.clear();
    std::ifstream f(path);
    if (!f)
    {
        std::error_code ec;
        if (fs::exists(path, ec) && !ec)
        {
            err = std::string("Failed to open init hints file for reading: ") + path;
            return false;
        }
        return true; // no file: keep defaults
    }

    json j;
    try
    {
        f >> j;
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to parse init hints (") + path + "): " + e.what();
        return false;
    }
    return ApplyParsed(j, out, err);
}

std::string InitHintsToJson(const InitHints& hints)
{
    return ToJson(hints).dump(2);
}

bool SaveInitHints(const std::string& path, const InitHints& hints, std::string& err)
{
    err.clear();
    try
    {
        fs::path p(path);
        if (p.has_parent_path())
            fs::create_directories(p.parent_path());
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to create config directory: ") + e.what();
        return false;
    }

    // Atomic write: write to a temp file in the same directory then rename over the original.
    const std::string tmp_path = path + ".tmp";
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        err = "Failed to open temp init hints file for writing.";
        return false;
    }
    out << InitHintsToJson(hints) << "\n";
    out.close();
    if (!out)
    {
        err = "Failed to finalize init hints temp file write.";
        return false;
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec)
    {
        err = std::string("Failed to atomically replace init hints file: ") + ec.message();
        std::error_code rm_ec;
        fs::remove(tmp_path, rm_ec);
        return false;
    }
    return true;
}
} // namespace crt
