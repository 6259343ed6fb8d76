#pragma once

#include "imgui.h"
#include "imgui_impl_vulkan.h"

#include <SDL3/SDL.h>
#include <SDL3/SDL_vulkan.h>

#include <functional>

#include "core/errors.h"

namespace crt
{
// Instance/device/queue/swapchain plumbing built on Dear ImGui's ImGui_ImplVulkanH helpers.
//
// Failures are reported through `Error` instead of aborting; FrameRender/FramePresent return
// the raw VkResult so the backend can tell device loss apart from a stale swapchain.
struct VulkanState
{
    struct Options
    {
        uint32_t api_version = VK_API_VERSION_1_2;
        bool     srgb = false;
        bool     vsync = true;
    };

    // Vulkan core
    VkAllocationCallbacks* allocator = nullptr;
    VkInstance             instance = VK_NULL_HANDLE;
    VkPhysicalDevice       physical_device = VK_NULL_HANDLE;
    VkDevice               device = VK_NULL_HANDLE;
    uint32_t               queue_family = (uint32_t)-1;
    VkQueue                queue = VK_NULL_HANDLE;
    VkPipelineCache        pipeline_cache = VK_NULL_HANDLE;
    VkDescriptorPool       descriptor_pool = VK_NULL_HANDLE;

    // ImGui helper window data
    ImGui_ImplVulkanH_Window main_window{};
    uint32_t                 min_image_count = 2;
    bool                     swapchain_rebuild = false;
    Options                  options;

    // Records commands into the frame's command buffer.
    using RecordFn = std::function<void(VkCommandBuffer cmd, uint32_t frame_index)>;

    bool SetupVulkan(ImVector<const char*> instance_extensions, const Options& opts, Error& err);
    bool SetupVulkanWindow(ImGui_ImplVulkanH_Window* wd, VkSurfaceKHR surface, int width, int height, Error& err);
    void ResizeMainWindow(ImGui_ImplVulkanH_Window* wd, int width, int height);

    // `before_pass` runs before the swapchain render pass begins (offscreen passes),
    // `in_pass` inside it, then ImGui draw data (may be null) is recorded on top.
    // OUT_OF_DATE / SUBOPTIMAL only flag `swapchain_rebuild`; anything else is returned.
    VkResult FrameRender(ImGui_ImplVulkanH_Window* wd,
                         const RecordFn& before_pass,
                         const RecordFn& in_pass,
                         ImDrawData* draw_data,
                         bool& out_rendered);
    VkResult FramePresent(ImGui_ImplVulkanH_Window* wd);

    void CleanupVulkanWindow();
    void CleanupVulkan();
};
} // namespace crt
