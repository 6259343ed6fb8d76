#include "io/image_loader.h"

#include <cstdio>
#include <utility>

// stb_image implementation must live in exactly one translation unit.
#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h>

namespace crt
{
bool LoadRgbaImage(const std::string& path, const char* resource, RgbaImage& out, Error& err)
{
    err.Clear();
    out = RgbaImage{};
    if (path.empty())
        return err.Set(ErrorKind::Initialization, resource, "no image path given");

    int w = 0, h = 0, channels_in_file = 0;
    stbi_uc* data = stbi_load(path.c_str(), &w, &h, &channels_in_file, 4);
    if (!data)
    {
        const char* reason = stbi_failure_reason();
        std::fprintf(stderr, "[%s] %s: %s\n", resource, path.c_str(), reason ? reason : "unknown error");
        return err.Set(ErrorKind::Initialization, resource,
                       path + ": " + (reason ? reason : "unknown error"));
    }
    if (w <= 0 || h <= 0)
    {
        stbi_image_free(data);
        return err.Set(ErrorKind::Initialization, resource, path + ": empty image");
    }

    out.width = w;
    out.height = h;
    out.pixels.assign(data, data + (std::size_t)w * (std::size_t)h * 4u);
    stbi_image_free(data);
    return true;
}

bool CheckAtlasSize(const Font& font, int width, int height, Error& err)
{
    err.Clear();
    if (width <= 0 || height <= 0 || width % Font::kTilesPerRow != 0 || height % Font::kTileRows != 0)
        return err.Set(ErrorKind::Initialization, "font",
                       font.filename + ": " + std::to_string(width) + "x" + std::to_string(height) +
                           " does not split into 16x16 tiles");

    if (width != font.AtlasWidth() || height != font.AtlasHeight())
        std::fprintf(stderr, "[font] %s has %dx%d tiles, declared %dx%d\n", font.filename.c_str(),
                     width / Font::kTilesPerRow, height / Font::kTileRows, font.tile_w, font.tile_h);
    return true;
}

bool LoadFontAtlas(const Font& font, RgbaImage& out, Error& err)
{
    if (!LoadRgbaImage(font.filename, "font", out, err))
        return false;
    if (!CheckAtlasSize(font, out.width, out.height, err))
    {
        out = RgbaImage{};
        return false;
    }
    return true;
}

bool LoadWindowIcon(const std::string& path, WindowIcon& out, Error& err)
{
    RgbaImage img;
    if (!LoadRgbaImage(path, "icon", img, err))
        return false;
    out.width = img.width;
    out.height = img.height;
    out.pixels = std::move(img.pixels);
    return true;
}
} // namespace crt
