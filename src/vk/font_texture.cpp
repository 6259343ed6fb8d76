#include "vk/font_texture.h"

#include <cstdio>
#include <string>

#include "io/image_loader.h"
#include "vk/gpu_context.h"
#include "vk/vk_helpers.h"

namespace crt
{
FontTextureCache::~FontTextureCache()
{
    for (Entry& e : m_entries)
        Destroy(e);
    m_entries.clear();
}

void FontTextureCache::Destroy(Entry& e)
{
    VulkanState& vk = m_ctx.Vk();
    m_ctx.RemoveTexture(e.set);
    e.set = VK_NULL_HANDLE;
    if (e.view != VK_NULL_HANDLE)
        vkDestroyImageView(vk.device, e.view, vk.allocator);
    if (e.image != VK_NULL_HANDLE)
        vkDestroyImage(vk.device, e.image, vk.allocator);
    if (e.memory != VK_NULL_HANDLE)
        vkFreeMemory(vk.device, e.memory, vk.allocator);
    e = Entry{};
}

bool FontTextureCache::Bind(std::size_t index, Font& font, VkDescriptorSet& out_set, Error& err)
{
    out_set = VK_NULL_HANDLE;
    if (index >= m_entries.size())
        m_entries.resize(index + 1);
    Entry& e = m_entries[index];
    if (e.set != VK_NULL_HANDLE)
    {
        out_set = e.set;
        return true;
    }

    RgbaImage atlas;
    if (!LoadFontAtlas(font, atlas, err))
        return false;
    const int w = atlas.width;
    const int h = atlas.height;

    VulkanState& vk = m_ctx.Vk();
    if (!vkh::CheckVk(vkh::CreateImageRGBA8(vk.device, vk.allocator, vk.physical_device, w, h,
                                            VK_IMAGE_USAGE_SAMPLED_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT,
                                            e.image, e.memory, e.view),
                      "font image", "font", err))
    {
        Destroy(e);
        return false;
    }

    if (!m_ctx.Upload().UploadRGBA(e.image, e.layout, atlas.pixels.data(), atlas.pixels.size(), w, h))
    {
        Destroy(e);
        return err.Set(ErrorKind::Initialization, "font", font.filename + ": texture upload failed");
    }

    e.set = m_ctx.AddTexture(e.view);
    if (e.set == VK_NULL_HANDLE)
    {
        Destroy(e);
        return err.Set(ErrorKind::Initialization, "font", font.filename + ": descriptor set allocation failed");
    }

    font.texture_id = (void*)e.set;
    out_set = e.set;
    std::fprintf(stderr, "[font] loaded %s (%dx%d)\n", font.filename.c_str(), w, h);
    return true;
}
} // namespace crt
