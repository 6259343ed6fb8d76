#include "vk/vk_helpers.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <string>

namespace crt::vkh
{
bool CheckVk(VkResult res, const char* what, const char* resource, Error& err)
{
    if (res == VK_SUCCESS)
        return true;
    std::fprintf(stderr, "[vulkan] %s failed: VkResult = %d\n", what, (int)res);
    const ErrorKind kind = (res == VK_ERROR_DEVICE_LOST) ? ErrorKind::DeviceLost : ErrorKind::Initialization;
    return err.Set(kind, resource, std::string(what) + " failed (VkResult " + std::to_string((int)res) + ")");
}

bool CheckVkFrame(VkResult res, const char* what, const char* resource, Error& err)
{
    if (res == VK_SUCCESS)
        return true;
    std::fprintf(stderr, "[vulkan] %s failed during frame: VkResult = %d\n", what, (int)res);
    return err.Set(ErrorKind::DeviceLost, resource, std::string(what) + " failed (VkResult " + std::to_string((int)res) + ")");
}

void CheckVkResultCallback(VkResult res)
{
    if (res == VK_SUCCESS)
        return;
    std::fprintf(stderr, "[vulkan] Error: VkResult = %d\n", (int)res);
}

uint32_t FindMemoryType(VkPhysicalDevice phys, uint32_t type_filter, VkMemoryPropertyFlags properties)
{
    VkPhysicalDeviceMemoryProperties mem_props{};
    vkGetPhysicalDeviceMemoryProperties(phys, &mem_props);
    for (uint32_t i = 0; i < mem_props.memoryTypeCount; i++)
    {
        if ((type_filter & (1u << i)) &&
            ((mem_props.memoryTypes[i].propertyFlags & properties) == properties))
            return i;
    }
    return UINT32_MAX;
}

VkResult CreateBuffer(VkDevice device,
                      const VkAllocationCallbacks* allocator,
                      VkPhysicalDevice phys,
                      VkDeviceSize size,
                      VkBufferUsageFlags usage,
                      VkMemoryPropertyFlags mem_props,
                      VkBuffer& out_buf,
                      VkDeviceMemory& out_mem)
{
    out_buf = VK_NULL_HANDLE;
    out_mem = VK_NULL_HANDLE;

    VkBufferCreateInfo bi{};
    bi.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    bi.size = size;
    bi.usage = usage;
    bi.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    VkResult err = vkCreateBuffer(device, &bi, allocator, &out_buf);
    if (err != VK_SUCCESS)
        return err;

    VkMemoryRequirements req{};
    vkGetBufferMemoryRequirements(device, out_buf, &req);
    const uint32_t mem_type = FindMemoryType(phys, req.memoryTypeBits, mem_props);
    if (mem_type == UINT32_MAX)
        return VK_ERROR_INITIALIZATION_FAILED;

    VkMemoryAllocateInfo ai{};
    ai.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    ai.allocationSize = req.size;
    ai.memoryTypeIndex = mem_type;
    err = vkAllocateMemory(device, &ai, allocator, &out_mem);
    if (err != VK_SUCCESS)
        return err;

    return vkBindBufferMemory(device, out_buf, out_mem, 0);
}

VkResult CreateImageRGBA8(VkDevice device,
                          const VkAllocationCallbacks* allocator,
                          VkPhysicalDevice phys,
                          int width,
                          int height,
                          VkImageUsageFlags usage,
                          VkImage& out_img,
                          VkDeviceMemory& out_mem,
                          VkImageView& out_view)
{
    out_img = VK_NULL_HANDLE;
    out_mem = VK_NULL_HANDLE;
    out_view = VK_NULL_HANDLE;

    VkImageCreateInfo ii{};
    ii.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
    ii.imageType = VK_IMAGE_TYPE_2D;
    ii.format = VK_FORMAT_R8G8B8A8_UNORM;
    ii.extent.width = (uint32_t)std::max(1, width);
    ii.extent.height = (uint32_t)std::max(1, height);
    ii.extent.depth = 1;
    ii.mipLevels = 1;
    ii.arrayLayers = 1;
    ii.samples = VK_SAMPLE_COUNT_1_BIT;
    ii.tiling = VK_IMAGE_TILING_OPTIMAL;
    ii.usage = usage;
    ii.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    ii.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;

    VkResult err = vkCreateImage(device, &ii, allocator, &out_img);
    if (err != VK_SUCCESS)
        return err;

    VkMemoryRequirements req{};
    vkGetImageMemoryRequirements(device, out_img, &req);
    const uint32_t mem_type = FindMemoryType(phys, req.memoryTypeBits, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT);
    if (mem_type == UINT32_MAX)
        return VK_ERROR_INITIALIZATION_FAILED;

    VkMemoryAllocateInfo ai{};
    ai.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    ai.allocationSize = req.size;
    ai.memoryTypeIndex = mem_type;
    err = vkAllocateMemory(device, &ai, allocator, &out_mem);
    if (err != VK_SUCCESS)
        return err;

    err = vkBindImageMemory(device, out_img, out_mem, 0);
    if (err != VK_SUCCESS)
        return err;

    VkImageViewCreateInfo vi{};
    vi.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
    vi.image = out_img;
    vi.viewType = VK_IMAGE_VIEW_TYPE_2D;
    vi.format = VK_FORMAT_R8G8B8A8_UNORM;
    vi.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
    vi.subresourceRange.baseMipLevel = 0;
    vi.subresourceRange.levelCount = 1;
    vi.subresourceRange.baseArrayLayer = 0;
    vi.subresourceRange.layerCount = 1;
    return vkCreateImageView(device, &vi, allocator, &out_view);
}

VkSampler CreateNearestSampler(VkDevice device, const VkAllocationCallbacks* allocator)
{
    // NEAREST sampler for crisp pixel scaling.
    VkSamplerCreateInfo sci{};
    sci.sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO;
    sci.magFilter = VK_FILTER_NEAREST;
    sci.minFilter = VK_FILTER_NEAREST;
    sci.mipmapMode = VK_SAMPLER_MIPMAP_MODE_NEAREST;
    sci.addressModeU = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    sci.addressModeV = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    sci.addressModeW = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    sci.minLod = 0.0f;
    sci.maxLod = 0.0f;
    sci.maxAnisotropy = 1.0f;
    VkSampler sampler = VK_NULL_HANDLE;
    if (vkCreateSampler(device, &sci, allocator, &sampler) != VK_SUCCESS)
        return VK_NULL_HANDLE;
    return sampler;
}

bool UploadContext::Init(Error& err)
{
    VkCommandPoolCreateInfo pci{};
    pci.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    pci.queueFamilyIndex = queue_family;
    pci.flags = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT;
    if (!CheckVk(vkCreateCommandPool(device, &pci, allocator, &pool), "vkCreateCommandPool", "context", err))
        return false;

    VkFenceCreateInfo fci{};
    fci.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    return CheckVk(vkCreateFence(device, &fci, allocator, &fence), "vkCreateFence", "context", err);
}

void UploadContext::Shutdown()
{
    if (fence != VK_NULL_HANDLE)
    {
        vkDestroyFence(device, fence, allocator);
        fence = VK_NULL_HANDLE;
    }
    if (pool != VK_NULL_HANDLE)
    {
        vkDestroyCommandPool(device, pool, allocator);
        pool = VK_NULL_HANDLE;
    }
}

bool UploadContext::ImmediateSubmit(const std::function<void(VkCommandBuffer)>& record)
{
    if (!record || pool == VK_NULL_HANDLE)
        return false;

    VkCommandBufferAllocateInfo ai{};
    ai.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    ai.commandPool = pool;
    ai.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    ai.commandBufferCount = 1;

    VkCommandBuffer cmd = VK_NULL_HANDLE;
    VkResult err = vkAllocateCommandBuffers(device, &ai, &cmd);
    if (err != VK_SUCCESS)
        return false;

    VkCommandBufferBeginInfo bi{};
    bi.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    bi.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    err = vkBeginCommandBuffer(cmd, &bi);
    if (err == VK_SUCCESS)
    {
        record(cmd);
        err = vkEndCommandBuffer(cmd);
    }
    if (err == VK_SUCCESS)
        err = vkResetFences(device, 1, &fence);
    if (err == VK_SUCCESS)
    {
        VkSubmitInfo si{};
        si.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
        si.commandBufferCount = 1;
        si.pCommandBuffers = &cmd;
        err = vkQueueSubmit(queue, 1, &si, fence);
    }
    if (err == VK_SUCCESS)
        err = vkWaitForFences(device, 1, &fence, VK_TRUE, UINT64_MAX);

    vkFreeCommandBuffers(device, pool, 1, &cmd);
    if (err != VK_SUCCESS)
    {
        std::fprintf(stderr, "[vulkan] immediate submit failed: VkResult = %d\n", (int)err);
        return false;
    }
    return true;
}

bool UploadContext::UploadRGBA(VkImage image, VkImageLayout& layout, const void* rgba, std::size_t size_bytes, int w, int h)
{
    if (!rgba || size_bytes == 0 || w <= 0 || h <= 0)
        return false;

    VkBuffer staging = VK_NULL_HANDLE;
    VkDeviceMemory staging_mem = VK_NULL_HANDLE;

    VkResult err = CreateBuffer(device, allocator, physical,
                                (VkDeviceSize)size_bytes,
                                VK_BUFFER_USAGE_TRANSFER_SRC_BIT,
                                VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT,
                                staging, staging_mem);
    if (err != VK_SUCCESS)
    {
        if (staging != VK_NULL_HANDLE)
            vkDestroyBuffer(device, staging, allocator);
        if (staging_mem != VK_NULL_HANDLE)
            vkFreeMemory(device, staging_mem, allocator);
        return false;
    }

    void* mapped = nullptr;
    err = vkMapMemory(device, staging_mem, 0, (VkDeviceSize)size_bytes, 0, &mapped);
    if (err == VK_SUCCESS && mapped)
    {
        std::memcpy(mapped, rgba, size_bytes);
        vkUnmapMemory(device, staging_mem);
    }
    else
    {
        vkDestroyBuffer(device, staging, allocator);
        vkFreeMemory(device, staging_mem, allocator);
        return false;
    }

    const bool ok = ImmediateSubmit([&](VkCommandBuffer cmd) {
        VkImageMemoryBarrier to_transfer{};
        to_transfer.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER;
        const VkPipelineStageFlags src_stage =
            (layout == VK_IMAGE_LAYOUT_UNDEFINED) ? VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT : VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT;
        to_transfer.srcAccessMask = (layout == VK_IMAGE_LAYOUT_UNDEFINED) ? 0 : VK_ACCESS_SHADER_READ_BIT;
        to_transfer.dstAccessMask = VK_ACCESS_TRANSFER_WRITE_BIT;
        to_transfer.oldLayout = layout;
        to_transfer.newLayout = VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL;
        to_transfer.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        to_transfer.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        to_transfer.image = image;
        to_transfer.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
        to_transfer.subresourceRange.levelCount = 1;
        to_transfer.subresourceRange.layerCount = 1;
        vkCmdPipelineBarrier(cmd, src_stage, VK_PIPELINE_STAGE_TRANSFER_BIT,
                             0, 0, nullptr, 0, nullptr, 1, &to_transfer);

        VkBufferImageCopy copy{};
        copy.imageSubresource.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
        copy.imageSubresource.layerCount = 1;
        copy.imageExtent = { (uint32_t)w, (uint32_t)h, 1 };
        vkCmdCopyBufferToImage(cmd, staging, image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &copy);

        VkImageMemoryBarrier to_read{};
        to_read.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER;
        to_read.srcAccessMask = VK_ACCESS_TRANSFER_WRITE_BIT;
        to_read.dstAccessMask = VK_ACCESS_SHADER_READ_BIT;
        to_read.oldLayout = VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL;
        to_read.newLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
        to_read.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        to_read.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        to_read.image = image;
        to_read.subresourceRange = to_transfer.subresourceRange;
        vkCmdPipelineBarrier(cmd, VK_PIPELINE_STAGE_TRANSFER_BIT, VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT,
                             0, 0, nullptr, 0, nullptr, 1, &to_read);
    });
    if (ok)
        layout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;

    vkDestroyBuffer(device, staging, allocator);
    vkFreeMemory(device, staging_mem, allocator);
    return ok;
}
} // namespace crt::vkh
