// Small Vulkan helpers shared by the native backend (buffers, images, one-shot uploads).

#pragma once

#include <vulkan/vulkan.h>

#include <cstddef>
#include <functional>

#include "core/errors.h"

namespace crt::vkh
{
// Logs and fills `err` (Initialization, or DeviceLost for VK_ERROR_DEVICE_LOST) when `res` is
// not VK_SUCCESS.
bool CheckVk(VkResult res, const char* what, const char* resource, Error& err);

// Frame-time variant: the session cannot continue after any failure, so every non-success
// result is DeviceLost.
bool CheckVkFrame(VkResult res, const char* what, const char* resource, Error& err);

// Callback for ImGui_ImplVulkan_InitInfo::CheckVkResultFn.
void CheckVkResultCallback(VkResult res);

uint32_t FindMemoryType(VkPhysicalDevice phys, uint32_t type_filter, VkMemoryPropertyFlags properties);

VkResult CreateBuffer(VkDevice device,
                      const VkAllocationCallbacks* allocator,
                      VkPhysicalDevice phys,
                      VkDeviceSize size,
                      VkBufferUsageFlags usage,
                      VkMemoryPropertyFlags mem_props,
                      VkBuffer& out_buf,
                      VkDeviceMemory& out_mem);

VkResult CreateImageRGBA8(VkDevice device,
                          const VkAllocationCallbacks* allocator,
                          VkPhysicalDevice phys,
                          int width,
                          int height,
                          VkImageUsageFlags usage,
                          VkImage& out_img,
                          VkDeviceMemory& out_mem,
                          VkImageView& out_view);

VkSampler CreateNearestSampler(VkDevice device, const VkAllocationCallbacks* allocator);

// Transient command pool + fence for blocking uploads outside the frame command buffers.
struct UploadContext
{
    VkDevice                     device = VK_NULL_HANDLE;
    VkPhysicalDevice             physical = VK_NULL_HANDLE;
    VkQueue                      queue = VK_NULL_HANDLE;
    uint32_t                     queue_family = 0;
    const VkAllocationCallbacks* allocator = nullptr;

    VkCommandPool pool = VK_NULL_HANDLE;
    VkFence       fence = VK_NULL_HANDLE;

    bool Init(Error& err);
    void Shutdown();

    bool ImmediateSubmit(const std::function<void(VkCommandBuffer)>& record);

    // Staging copy into `image`, leaving it in SHADER_READ_ONLY_OPTIMAL. `layout` is the
    // image's current layout and is updated.
    bool UploadRGBA(VkImage image, VkImageLayout& layout, const void* rgba, std::size_t size_bytes, int w, int h);
};
} // namespace crt::vkh
