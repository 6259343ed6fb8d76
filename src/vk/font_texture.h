// GPU textures for the session's glyph sheets, uploaded the first time a font is bound.

#pragma once

#include <vulkan/vulkan.h>

#include <cstddef>
#include <vector>

#include "core/errors.h"
#include "core/font.h"

namespace crt
{
class GpuContext;

class FontTextureCache
{
public:
    explicit FontTextureCache(GpuContext& ctx) : m_ctx(ctx) {}
    ~FontTextureCache();

    FontTextureCache(const FontTextureCache&) = delete;
    FontTextureCache& operator=(const FontTextureCache&) = delete;

    // Loads and uploads `font` on first use; sets font.texture_id to the descriptor set.
    // Subsequent calls return the cached set.
    bool Bind(std::size_t index, Font& font, VkDescriptorSet& out_set, Error& err);

private:
    struct Entry
    {
        VkImage         image = VK_NULL_HANDLE;
        VkDeviceMemory  memory = VK_NULL_HANDLE;
        VkImageView     view = VK_NULL_HANDLE;
        VkImageLayout   layout = VK_IMAGE_LAYOUT_UNDEFINED;
        VkDescriptorSet set = VK_NULL_HANDLE;
    };

    void Destroy(Entry& e);

    GpuContext&        m_ctx;
    std::vector<Entry> m_entries;
};
} // namespace crt
