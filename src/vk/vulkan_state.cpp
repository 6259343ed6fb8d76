#include "vk/vulkan_state.h"

#include <cstdio>
#include <cstring>

#include "vk/vk_helpers.h"

namespace crt
{
static bool IsExtensionAvailable(const ImVector<VkExtensionProperties>& properties, const char* extension)
{
    for (const VkExtensionProperties& p : properties)
        if (std::strcmp(p.extensionName, extension) == 0)
            return true;
    return false;
}

bool VulkanState::SetupVulkan(ImVector<const char*> instance_extensions, const Options& opts, Error& err)
{
    options = opts;

    // Create Vulkan Instance
    {
        VkApplicationInfo app{};
        app.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
        app.pApplicationName = "crtgrid";
        app.pEngineName = "crtgrid";
        app.apiVersion = opts.api_version;

        VkInstanceCreateInfo create_info = {};
        create_info.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
        create_info.pApplicationInfo = &app;

        // Enumerate available extensions
        uint32_t properties_count = 0;
        ImVector<VkExtensionProperties> properties;
        vkEnumerateInstanceExtensionProperties(nullptr, &properties_count, nullptr);
        properties.resize(properties_count);
        if (!vkh::CheckVk(vkEnumerateInstanceExtensionProperties(nullptr, &properties_count, properties.Data),
                          "vkEnumerateInstanceExtensionProperties", "context", err))
            return false;

        // Enable required extensions
        if (IsExtensionAvailable(properties, VK_KHR_GET_PHYSICAL_DEVICE_PROPERTIES_2_EXTENSION_NAME))
            instance_extensions.push_back(VK_KHR_GET_PHYSICAL_DEVICE_PROPERTIES_2_EXTENSION_NAME);
#ifdef VK_KHR_PORTABILITY_ENUMERATION_EXTENSION_NAME
        if (IsExtensionAvailable(properties, VK_KHR_PORTABILITY_ENUMERATION_EXTENSION_NAME))
        {
            instance_extensions.push_back(VK_KHR_PORTABILITY_ENUMERATION_EXTENSION_NAME);
            create_info.flags |= VK_INSTANCE_CREATE_ENUMERATE_PORTABILITY_BIT_KHR;
        }
#endif

        create_info.enabledExtensionCount = (uint32_t)instance_extensions.Size;
        create_info.ppEnabledExtensionNames = instance_extensions.Data;
        if (!vkh::CheckVk(vkCreateInstance(&create_info, allocator, &instance), "vkCreateInstance", "context", err))
            return false;
    }

    // Select Physical Device (GPU)
    physical_device = ImGui_ImplVulkanH_SelectPhysicalDevice(instance);
    if (physical_device == VK_NULL_HANDLE)
        return err.Set(ErrorKind::Initialization, "context", "no Vulkan physical device available");

    // Select graphics queue family
    queue_family = ImGui_ImplVulkanH_SelectQueueFamilyIndex(physical_device);
    if (queue_family == (uint32_t)-1)
        return err.Set(ErrorKind::Initialization, "context", "no graphics queue family available");

    // Create Logical Device (with 1 queue)
    {
        ImVector<const char*> device_extensions;
        device_extensions.push_back("VK_KHR_swapchain");

        uint32_t properties_count = 0;
        ImVector<VkExtensionProperties> properties;
        vkEnumerateDeviceExtensionProperties(physical_device, nullptr, &properties_count, nullptr);
        properties.resize(properties_count);
        vkEnumerateDeviceExtensionProperties(physical_device, nullptr, &properties_count, properties.Data);
#ifdef VK_KHR_PORTABILITY_SUBSET_EXTENSION_NAME
        if (IsExtensionAvailable(properties, VK_KHR_PORTABILITY_SUBSET_EXTENSION_NAME))
            device_extensions.push_back(VK_KHR_PORTABILITY_SUBSET_EXTENSION_NAME);
#endif

        const float queue_priority[] = { 1.0f };
        VkDeviceQueueCreateInfo queue_info[1] = {};
        queue_info[0].sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        queue_info[0].queueFamilyIndex = queue_family;
        queue_info[0].queueCount = 1;
        queue_info[0].pQueuePriorities = queue_priority;

        VkDeviceCreateInfo create_info = {};
        create_info.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
        create_info.queueCreateInfoCount = 1;
        create_info.pQueueCreateInfos = queue_info;
        create_info.enabledExtensionCount = (uint32_t)device_extensions.Size;
        create_info.ppEnabledExtensionNames = device_extensions.Data;

        if (!vkh::CheckVk(vkCreateDevice(physical_device, &create_info, allocator, &device), "vkCreateDevice", "context", err))
            return false;
        vkGetDeviceQueue(device, queue_family, 0, &queue);
    }

    // Create Descriptor Pool (font atlases, backing image, ImGui font texture)
    {
        VkDescriptorPoolSize pool_sizes[] =
        {
            { VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, IMGUI_IMPL_VULKAN_MINIMUM_IMAGE_SAMPLER_POOL_SIZE + 64 },
        };
        VkDescriptorPoolCreateInfo pool_info = {};
        pool_info.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
        pool_info.flags = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
        pool_info.maxSets = 0;
        for (VkDescriptorPoolSize& pool_size : pool_sizes)
            pool_info.maxSets += pool_size.descriptorCount;
        pool_info.poolSizeCount = (uint32_t)IM_ARRAYSIZE(pool_sizes);
        pool_info.pPoolSizes = pool_sizes;

        if (!vkh::CheckVk(vkCreateDescriptorPool(device, &pool_info, allocator, &descriptor_pool),
                          "vkCreateDescriptorPool", "context", err))
            return false;
    }
    return true;
}

bool VulkanState::SetupVulkanWindow(ImGui_ImplVulkanH_Window* wd, VkSurfaceKHR surface, int width, int height, Error& err)
{
    wd->Surface = surface;

    // Check for WSI support
    VkBool32 res = VK_FALSE;
    vkGetPhysicalDeviceSurfaceSupportKHR(physical_device, queue_family, wd->Surface, &res);
    if (res != VK_TRUE)
        return err.Set(ErrorKind::Initialization, "context", "no WSI support on the selected physical device");

    // Select Surface Format
    const VkFormat unorm_formats[] =
    {
        VK_FORMAT_B8G8R8A8_UNORM,
        VK_FORMAT_R8G8B8A8_UNORM,
        VK_FORMAT_B8G8R8_UNORM,
        VK_FORMAT_R8G8B8_UNORM
    };
    const VkFormat srgb_formats[] =
    {
        VK_FORMAT_B8G8R8A8_SRGB,
        VK_FORMAT_R8G8B8A8_SRGB,
        VK_FORMAT_B8G8R8A8_UNORM,
        VK_FORMAT_R8G8B8A8_UNORM
    };
    const VkColorSpaceKHR request_color_space = VK_COLORSPACE_SRGB_NONLINEAR_KHR;
    if (options.srgb)
        wd->SurfaceFormat = ImGui_ImplVulkanH_SelectSurfaceFormat(
            physical_device, wd->Surface, srgb_formats, (size_t)IM_ARRAYSIZE(srgb_formats), request_color_space);
    else
        wd->SurfaceFormat = ImGui_ImplVulkanH_SelectSurfaceFormat(
            physical_device, wd->Surface, unorm_formats, (size_t)IM_ARRAYSIZE(unorm_formats), request_color_space);

    // Select Present Mode
    if (options.vsync)
    {
        VkPresentModeKHR present_modes[] = { VK_PRESENT_MODE_FIFO_KHR };
        wd->PresentMode = ImGui_ImplVulkanH_SelectPresentMode(
            physical_device, wd->Surface, &present_modes[0], IM_ARRAYSIZE(present_modes));
    }
    else
    {
        VkPresentModeKHR present_modes[] =
        {
            VK_PRESENT_MODE_MAILBOX_KHR,
            VK_PRESENT_MODE_IMMEDIATE_KHR,
            VK_PRESENT_MODE_FIFO_KHR
        };
        wd->PresentMode = ImGui_ImplVulkanH_SelectPresentMode(
            physical_device, wd->Surface, &present_modes[0], IM_ARRAYSIZE(present_modes));
    }

    wd->ClearEnable = true;
    wd->ClearValue.color.float32[0] = 0.0f;
    wd->ClearValue.color.float32[1] = 0.0f;
    wd->ClearValue.color.float32[2] = 0.0f;
    wd->ClearValue.color.float32[3] = 1.0f;

    // Create SwapChain, RenderPass, Framebuffer, etc.
    if (min_image_count < 2)
        min_image_count = 2;
    ImGui_ImplVulkanH_CreateOrResizeWindow(
        instance, physical_device, device, wd, queue_family, allocator,
        width, height, min_image_count, 0);
    if (wd->Swapchain == VK_NULL_HANDLE)
        return err.Set(ErrorKind::Initialization, "context", "swapchain creation failed");
    return true;
}

void VulkanState::ResizeMainWindow(ImGui_ImplVulkanH_Window* wd, int width, int height)
{
    ImGui_ImplVulkan_SetMinImageCount(min_image_count);
    ImGui_ImplVulkanH_CreateOrResizeWindow(
        instance, physical_device, device, wd, queue_family, allocator,
        width, height, min_image_count, 0);
    wd->FrameIndex = 0;
    swapchain_rebuild = false;
}

void VulkanState::CleanupVulkan()
{
    if (device != VK_NULL_HANDLE && descriptor_pool != VK_NULL_HANDLE)
        vkDestroyDescriptorPool(device, descriptor_pool, allocator);
    descriptor_pool = VK_NULL_HANDLE;

    if (device != VK_NULL_HANDLE)
        vkDestroyDevice(device, allocator);
    device = VK_NULL_HANDLE;

    if (instance != VK_NULL_HANDLE)
        vkDestroyInstance(instance, allocator);
    instance = VK_NULL_HANDLE;
}

void VulkanState::CleanupVulkanWindow()
{
    if (instance == VK_NULL_HANDLE || device == VK_NULL_HANDLE)
        return;
    ImGui_ImplVulkanH_DestroyWindow(instance, device, &main_window, allocator);
}

VkResult VulkanState::FrameRender(ImGui_ImplVulkanH_Window* wd,
                                  const RecordFn& before_pass,
                                  const RecordFn& in_pass,
                                  ImDrawData* draw_data,
                                  bool& out_rendered)
{
    out_rendered = false;
    VkSemaphore image_acquired_semaphore  = wd->FrameSemaphores[wd->SemaphoreIndex].ImageAcquiredSemaphore;
    VkSemaphore render_complete_semaphore = wd->FrameSemaphores[wd->SemaphoreIndex].RenderCompleteSemaphore;
    VkResult err = vkAcquireNextImageKHR(
        device, wd->Swapchain, UINT64_MAX,
        image_acquired_semaphore, VK_NULL_HANDLE, &wd->FrameIndex);
    if (err == VK_ERROR_OUT_OF_DATE_KHR || err == VK_SUBOPTIMAL_KHR)
        swapchain_rebuild = true;
    if (err == VK_ERROR_OUT_OF_DATE_KHR)
        return VK_SUCCESS;
    if (err != VK_SUBOPTIMAL_KHR && err != VK_SUCCESS)
        return err;

    ImGui_ImplVulkanH_Frame* fd = &wd->Frames[wd->FrameIndex];
    err = vkWaitForFences(device, 1, &fd->Fence, VK_TRUE, UINT64_MAX);
    if (err != VK_SUCCESS)
        return err;
    err = vkResetFences(device, 1, &fd->Fence);
    if (err != VK_SUCCESS)
        return err;

    err = vkResetCommandPool(device, fd->CommandPool, 0);
    if (err != VK_SUCCESS)
        return err;
    {
        VkCommandBufferBeginInfo info = {};
        info.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
        info.flags |= VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
        err = vkBeginCommandBuffer(fd->CommandBuffer, &info);
        if (err != VK_SUCCESS)
            return err;
    }

    if (before_pass)
        before_pass(fd->CommandBuffer, wd->FrameIndex);

    {
        VkRenderPassBeginInfo info = {};
        info.sType = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
        info.renderPass = wd->RenderPass;
        info.framebuffer = fd->Framebuffer;
        info.renderArea.extent.width = wd->Width;
        info.renderArea.extent.height = wd->Height;
        info.clearValueCount = 1;
        info.pClearValues = &wd->ClearValue;
        vkCmdBeginRenderPass(fd->CommandBuffer, &info, VK_SUBPASS_CONTENTS_INLINE);
    }

    if (in_pass)
        in_pass(fd->CommandBuffer, wd->FrameIndex);

    if (draw_data)
        ImGui_ImplVulkan_RenderDrawData(draw_data, fd->CommandBuffer);

    vkCmdEndRenderPass(fd->CommandBuffer);
    {
        VkPipelineStageFlags wait_stage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
        VkSubmitInfo info = {};
        info.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
        info.waitSemaphoreCount = 1;
        info.pWaitSemaphores = &image_acquired_semaphore;
        info.pWaitDstStageMask = &wait_stage;
        info.commandBufferCount = 1;
        info.pCommandBuffers = &fd->CommandBuffer;
        info.signalSemaphoreCount = 1;
        info.pSignalSemaphores = &render_complete_semaphore;

        err = vkEndCommandBuffer(fd->CommandBuffer);
        if (err != VK_SUCCESS)
            return err;
        err = vkQueueSubmit(queue, 1, &info, fd->Fence);
        if (err != VK_SUCCESS)
            return err;
    }
    out_rendered = true;
    return VK_SUCCESS;
}

VkResult VulkanState::FramePresent(ImGui_ImplVulkanH_Window* wd)
{
    if (swapchain_rebuild)
        return VK_SUCCESS;
    VkSemaphore render_complete_semaphore = wd->FrameSemaphores[wd->SemaphoreIndex].RenderCompleteSemaphore;
    VkPresentInfoKHR info = {};
    info.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    info.waitSemaphoreCount = 1;
    info.pWaitSemaphores = &render_complete_semaphore;
    info.swapchainCount = 1;
    info.pSwapchains = &wd->Swapchain;
    info.pImageIndices = &wd->FrameIndex;
    VkResult err = vkQueuePresentKHR(queue, &info);
    if (err == VK_ERROR_OUT_OF_DATE_KHR || err == VK_SUBOPTIMAL_KHR)
        swapchain_rebuild = true;
    if (err == VK_ERROR_OUT_OF_DATE_KHR)
        return VK_SUCCESS;
    if (err != VK_SUBOPTIMAL_KHR && err != VK_SUCCESS)
        return err;
    wd->SemaphoreIndex = (wd->SemaphoreIndex + 1) % wd->SemaphoreCount;
    return VK_SUCCESS;
}
} // namespace crt
