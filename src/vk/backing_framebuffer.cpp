#include "vk/backing_framebuffer.h"

#include <cstdio>

#include "vk/gpu_context.h"
#include "vk/vk_helpers.h"

namespace crt
{
bool CreateBackingRenderPass(GpuContext& ctx, VkRenderPass& out, Error& err)
{
    out = VK_NULL_HANDLE;

    VkAttachmentDescription attachment{};
    attachment.format = VK_FORMAT_R8G8B8A8_UNORM;
    attachment.samples = VK_SAMPLE_COUNT_1_BIT;
    attachment.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
    attachment.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
    attachment.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    attachment.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    attachment.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    attachment.finalLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;

    VkAttachmentReference color_ref{};
    color_ref.attachment = 0;
    color_ref.layout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;

    VkSubpassDescription subpass{};
    subpass.pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
    subpass.colorAttachmentCount = 1;
    subpass.pColorAttachments = &color_ref;

    VkSubpassDependency deps[2] = {};
    // Previous frame's composite read -> this frame's writes.
    deps[0].srcSubpass = VK_SUBPASS_EXTERNAL;
    deps[0].dstSubpass = 0;
    deps[0].srcStageMask = VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT;
    deps[0].dstStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    deps[0].srcAccessMask = VK_ACCESS_SHADER_READ_BIT;
    deps[0].dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;
    // Writes -> composite sampling.
    deps[1].srcSubpass = 0;
    deps[1].dstSubpass = VK_SUBPASS_EXTERNAL;
    deps[1].srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    deps[1].dstStageMask = VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT;
    deps[1].srcAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;
    deps[1].dstAccessMask = VK_ACCESS_SHADER_READ_BIT;

    VkRenderPassCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO;
    info.attachmentCount = 1;
    info.pAttachments = &attachment;
    info.subpassCount = 1;
    info.pSubpasses = &subpass;
    info.dependencyCount = 2;
    info.pDependencies = deps;

    VulkanState& vk = ctx.Vk();
    return vkh::CheckVk(vkCreateRenderPass(vk.device, &info, vk.allocator, &out),
                        "vkCreateRenderPass(backing)", "framebuffer", err);
}

std::unique_ptr<BackingFramebuffer> BackingFramebuffer::Build(GpuContext& ctx, VkRenderPass pass,
                                                              int width, int height, Error& err)
{
    if (width <= 0 || height <= 0)
    {
        err.Set(ErrorKind::Initialization, "framebuffer", "backing buffer size must be positive");
        return nullptr;
    }

    std::unique_ptr<BackingFramebuffer> fb(new BackingFramebuffer(ctx));
    fb->m_width = width;
    fb->m_height = height;

    VulkanState& vk = ctx.Vk();
    if (!vkh::CheckVk(vkh::CreateImageRGBA8(vk.device, vk.allocator, vk.physical_device, width, height,
                                            VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_SAMPLED_BIT,
                                            fb->m_image, fb->m_memory, fb->m_view),
                      "backing image", "framebuffer", err))
        return nullptr;

    VkFramebufferCreateInfo fi{};
    fi.sType = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO;
    fi.renderPass = pass;
    fi.attachmentCount = 1;
    fi.pAttachments = &fb->m_view;
    fi.width = (uint32_t)width;
    fi.height = (uint32_t)height;
    fi.layers = 1;
    if (!vkh::CheckVk(vkCreateFramebuffer(vk.device, &fi, vk.allocator, &fb->m_framebuffer),
                      "vkCreateFramebuffer", "framebuffer", err))
        return nullptr;

    fb->m_texture = ctx.AddTexture(fb->m_view);
    if (fb->m_texture == VK_NULL_HANDLE)
    {
        err.Set(ErrorKind::Initialization, "framebuffer", "descriptor set allocation failed");
        return nullptr;
    }

    std::fprintf(stderr, "[vulkan] backing buffer %dx%d\n", width, height);
    return fb;
}

BackingFramebuffer::~BackingFramebuffer()
{
    VulkanState& vk = m_ctx.Vk();
    m_ctx.RemoveTexture(m_texture);
    if (m_framebuffer != VK_NULL_HANDLE)
        vkDestroyFramebuffer(vk.device, m_framebuffer, vk.allocator);
    if (m_view != VK_NULL_HANDLE)
        vkDestroyImageView(vk.device, m_view, vk.allocator);
    if (m_image != VK_NULL_HANDLE)
        vkDestroyImage(vk.device, m_image, vk.allocator);
    if (m_memory != VK_NULL_HANDLE)
        vkFreeMemory(vk.device, m_memory, vk.allocator);
}
} // namespace crt
