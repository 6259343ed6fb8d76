// Native render backend: SDL3 event pump + Vulkan backing/composite passes.

#pragma once

#include <vulkan/vulkan.h>

#include <memory>
#include <vector>

#include "core/render_backend.h"
#include "vk/backing_framebuffer.h"
#include "vk/console_gpu_buffers.h"
#include "vk/font_texture.h"
#include "vk/shader_registry.h"

namespace crt
{
class GpuContext;

class VulkanBackend final : public RenderBackend
{
public:
    struct Options
    {
        bool vsync = true;
        bool resize_scaling = true;
        bool debug_overlay = false;
        int  logical_w = 0; // initial logical window size
        int  logical_h = 0;
    };

    VulkanBackend(GpuContext& ctx, const Options& opts);
    ~VulkanBackend() override;

    VulkanBackend(const VulkanBackend&) = delete;
    VulkanBackend& operator=(const VulkanBackend&) = delete;

    // Compiles shaders, creates the backing render pass, pipelines and the composite quad.
    bool Init(Error& err);

    void SetDebugOverlay(bool enabled) { m_opts.debug_overlay = enabled; }
    bool DebugOverlay() const { return m_opts.debug_overlay; }

    // RenderBackend
    bool PumpEvents(InputCollector& input, SurfaceEvents& surface, Error& err) override;
    double NowSeconds() override;
    float ScaleFactor() const override;
    bool RebuildBackingBuffer(int device_w, int device_h, Error& err) override;
    bool RenderFrame(Terminal& term, const FrameParams& params, Error& err) override;
    bool BlocksOnVsync() const override { return m_opts.vsync; }
    void Sleep(double seconds) override;

private:
    bool EnsureSwapchain(Error& err);
    bool CreateQuadBuffer(Error& err);
    void RecordConsoles(VkCommandBuffer cmd, uint32_t slot, Terminal& term, Error& record_err);
    void RecordComposite(VkCommandBuffer cmd, const FrameParams& params);
    void BuildOverlay(const Terminal& term);

    GpuContext& m_ctx;
    Options     m_opts;

    ShaderRegistry                      m_shaders;
    VkRenderPass                        m_backing_pass = VK_NULL_HANDLE;
    std::unique_ptr<BackingFramebuffer> m_backing;
    std::unique_ptr<FontTextureCache>   m_fonts;
    std::vector<std::unique_ptr<ConsoleGpuBuffers>> m_layer_buffers;
    uint32_t                            m_slot_count = 0;

    VkBuffer       m_quad_buffer = VK_NULL_HANDLE;
    VkDeviceMemory m_quad_memory = VK_NULL_HANDLE;

    // Logical pixel space for pointer mapping.
    int m_logical_w = 0;
    int m_logical_h = 0;
};
} // namespace crt
