// Off-screen RGBA8 render target sized in device pixels.
//
// Consoles render into it; the composite pass samples it onto the swapchain. A size change
// always builds a new buffer (the old one is destroyed after the GPU is idle).

#pragma once

#include <vulkan/vulkan.h>

#include <memory>

#include "core/errors.h"

namespace crt
{
class GpuContext;

// Render pass for the backing image: clear, store, final layout SHADER_READ_ONLY_OPTIMAL.
bool CreateBackingRenderPass(GpuContext& ctx, VkRenderPass& out, Error& err);

class BackingFramebuffer
{
public:
    ~BackingFramebuffer();

    BackingFramebuffer(const BackingFramebuffer&) = delete;
    BackingFramebuffer& operator=(const BackingFramebuffer&) = delete;

    static std::unique_ptr<BackingFramebuffer> Build(GpuContext& ctx, VkRenderPass pass,
                                                     int width, int height, Error& err);

    int Width() const { return m_width; }
    int Height() const { return m_height; }
    VkFramebuffer Framebuffer() const { return m_framebuffer; }
    VkDescriptorSet Texture() const { return m_texture; }

private:
    explicit BackingFramebuffer(GpuContext& ctx) : m_ctx(ctx) {}

    GpuContext&     m_ctx;
    int             m_width = 0;
    int             m_height = 0;
    VkImage         m_image = VK_NULL_HANDLE;
    VkDeviceMemory  m_memory = VK_NULL_HANDLE;
    VkImageView     m_view = VK_NULL_HANDLE;
    VkFramebuffer   m_framebuffer = VK_NULL_HANDLE;
    VkDescriptorSet m_texture = VK_NULL_HANDLE;
};
} // namespace crt
