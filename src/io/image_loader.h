// Image decoding for glyph sheets and window icons. Everything comes out as RGBA8.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/errors.h"
#include "core/font.h"
#include "core/init_hints.h"

namespace crt
{
struct RgbaImage
{
    std::vector<std::uint8_t> pixels; // width * height * 4, row-major, top row first
    int width = 0;
    int height = 0;
};

// Fails with Initialization on `resource` ("font", "icon") when the file cannot be decoded.
bool LoadRgbaImage(const std::string& path, const char* resource, RgbaImage& out, Error& err);

// A glyph sheet must split evenly into the 16x16 tile grid. A tile size other than the
// font's declared one only logs: UVs are grid relative.
bool CheckAtlasSize(const Font& font, int width, int height, Error& err);

bool LoadFontAtlas(const Font& font, RgbaImage& out, Error& err);

bool LoadWindowIcon(const std::string& path, WindowIcon& out, Error& err);
} // namespace crt
