// Native GPU context: SDL3 window + Vulkan device/swapchain + Dear ImGui backends.
//
// Only one context may be live per process. Creation is all-or-nothing: whatever was
// created before a failing step is released by the destructor of the partially built object.

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "core/errors.h"
#include "core/init_hints.h"
#include "core/window_placement.h"
#include "vk/vk_helpers.h"
#include "vk/vulkan_state.h"

namespace crt
{
class GpuContext
{
public:
    ~GpuContext();

    GpuContext(const GpuContext&) = delete;
    GpuContext& operator=(const GpuContext&) = delete;

    // width/height are logical (window) pixels.
    static std::unique_ptr<GpuContext> Create(int width, int height, const std::string& title,
                                              const InitHints& hints, Error& err);

    SDL_Window* Window() const { return m_window; }
    VulkanState& Vk() { return m_vk; }
    ImGui_ImplVulkanH_Window* MainWindow() { return &m_vk.main_window; }
    vkh::UploadContext& Upload() { return m_upload; }
    VkSampler NearestSampler() const { return m_sampler; }
    VkDescriptorSetLayout TextureSetLayout() const { return m_texture_layout; }

    // Device pixels per logical pixel.
    float PixelDensity() const;
    void WindowSize(int& w, int& h) const;
    void WindowSizeInPixels(int& w, int& h) const;

    // Registers a sampled image with the shared texture layout (binding 0, fragment stage).
    VkDescriptorSet AddTexture(VkImageView view);
    void RemoveTexture(VkDescriptorSet set);

    const std::vector<MonitorInfo>& Monitors() const { return m_monitors; }

private:
    GpuContext() = default;

    bool Init(int width, int height, const std::string& title, const InitHints& hints, Error& err);
    bool ApplyIcon(const InitHints& hints);

    bool m_owns_slot = false;
    bool m_sdl_initialized = false;
    bool m_window_setup = false;
    bool m_imgui_context = false;
    bool m_imgui_sdl = false;
    bool m_imgui_vulkan = false;

    SDL_Window*              m_window = nullptr;
    VkSurfaceKHR             m_pending_surface = VK_NULL_HANDLE;
    VulkanState              m_vk;
    vkh::UploadContext       m_upload;
    VkSampler                m_sampler = VK_NULL_HANDLE;
    VkDescriptorSetLayout    m_texture_layout = VK_NULL_HANDLE;
    std::vector<MonitorInfo> m_monitors;
};
} // namespace crt
