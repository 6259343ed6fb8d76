#include "vk/vulkan_backend.h"

#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_vulkan.h"

#include <cstdio>
#include <cstring>

#include "core/console.h"
#include "core/terminal.h"
#include "vk/gpu_context.h"
#include "vk/sdl_input.h"
#include "vk/vk_helpers.h"

namespace crt
{
VulkanBackend::VulkanBackend(GpuContext& ctx, const Options& opts)
    : m_ctx(ctx)
    , m_opts(opts)
    , m_logical_w(opts.logical_w)
    , m_logical_h(opts.logical_h)
{
}

VulkanBackend::~VulkanBackend()
{
    VulkanState& vk = m_ctx.Vk();
    if (vk.device != VK_NULL_HANDLE)
        vkDeviceWaitIdle(vk.device);

    m_layer_buffers.clear();
    m_fonts.reset();
    m_backing.reset();
    m_shaders.DestroyPipelines();
    if (m_backing_pass != VK_NULL_HANDLE)
        vkDestroyRenderPass(vk.device, m_backing_pass, vk.allocator);
    if (m_quad_buffer != VK_NULL_HANDLE)
        vkDestroyBuffer(vk.device, m_quad_buffer, vk.allocator);
    if (m_quad_memory != VK_NULL_HANDLE)
        vkFreeMemory(vk.device, m_quad_memory, vk.allocator);
}

bool VulkanBackend::Init(Error& err)
{
    err.Clear();
    if (!m_shaders.CompileAll(err))
        return false;
    if (!CreateBackingRenderPass(m_ctx, m_backing_pass, err))
        return false;

    VulkanState& vk = m_ctx.Vk();
    ShaderRegistry::PipelineInfo pi;
    pi.device = vk.device;
    pi.allocator = vk.allocator;
    pi.cache = vk.pipeline_cache;
    pi.texture_layout = m_ctx.TextureSetLayout();
    pi.backing_pass = m_backing_pass;
    pi.present_pass = vk.main_window.RenderPass;
    if (!m_shaders.BuildPipelines(pi, err))
        return false;

    if (!CreateQuadBuffer(err))
        return false;

    m_fonts = std::make_unique<FontTextureCache>(m_ctx);
    m_slot_count = (uint32_t)vk.main_window.ImageCount;
    return true;
}

bool VulkanBackend::CreateQuadBuffer(Error& err)
{
    // Two triangles covering clip space; uv (0,0) is the top-left of the backing image.
    const QuadVertex quad[6] = {
        {{-1.0f, -1.0f}, {0.0f, 0.0f}},
        {{ 1.0f, -1.0f}, {1.0f, 0.0f}},
        {{ 1.0f,  1.0f}, {1.0f, 1.0f}},
        {{-1.0f, -1.0f}, {0.0f, 0.0f}},
        {{ 1.0f,  1.0f}, {1.0f, 1.0f}},
        {{-1.0f,  1.0f}, {0.0f, 1.0f}},
    };

    VulkanState& vk = m_ctx.Vk();
    if (!vkh::CheckVk(vkh::CreateBuffer(vk.device, vk.allocator, vk.physical_device, sizeof(quad),
                                        VK_BUFFER_USAGE_VERTEX_BUFFER_BIT,
                                        VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT,
                                        m_quad_buffer, m_quad_memory),
                      "composite quad buffer", "framebuffer", err))
        return false;

    void* mapped = nullptr;
    if (!vkh::CheckVk(vkMapMemory(vk.device, m_quad_memory, 0, sizeof(quad), 0, &mapped), "vkMapMemory", "framebuffer", err))
        return false;
    std::memcpy(mapped, quad, sizeof(quad));
    vkUnmapMemory(vk.device, m_quad_memory);
    return true;
}

bool VulkanBackend::PumpEvents(InputCollector& input, SurfaceEvents& surface, Error& err)
{
    err.Clear();
    SDL_Window* window = m_ctx.Window();
    const SDL_WindowID window_id = SDL_GetWindowID(window);

    SDL_Event event;
    while (SDL_PollEvent(&event))
    {
        if (m_opts.debug_overlay)
            ImGui_ImplSDL3_ProcessEvent(&event);

        switch (event.type)
        {
        case SDL_EVENT_QUIT:
            surface.quit_requested = true;
            break;
        case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
            if (event.window.windowID == window_id)
                surface.quit_requested = true;
            break;
        case SDL_EVENT_KEY_DOWN:
            if (std::optional<Key> k = KeyFromSdl(event.key.key))
                input.OnKeyDown(*k, ModifiersFromSdl(event.key.mod));
            else
                input.OnModifiers(ModifiersFromSdl(event.key.mod));
            break;
        case SDL_EVENT_KEY_UP:
            if (std::optional<Key> k = KeyFromSdl(event.key.key))
                input.OnKeyUp(*k, ModifiersFromSdl(event.key.mod));
            else
                input.OnModifiers(ModifiersFromSdl(event.key.mod));
            break;
        case SDL_EVENT_MOUSE_MOTION:
        {
            int ww = 0, wh = 0;
            m_ctx.WindowSize(ww, wh);
            int lx = 0, ly = 0;
            MapPointerToLogical(event.motion.x, event.motion.y, ww, wh, m_logical_w, m_logical_h,
                                m_opts.resize_scaling, lx, ly);
            input.OnPointerMoved(lx, ly);
            break;
        }
        case SDL_EVENT_MOUSE_BUTTON_DOWN:
        case SDL_EVENT_MOUSE_BUTTON_UP:
            if (event.button.button == SDL_BUTTON_LEFT)
                input.OnLeftButton(event.type == SDL_EVENT_MOUSE_BUTTON_DOWN);
            break;
        case SDL_EVENT_WINDOW_RESIZED:
            if (event.window.windowID == window_id)
            {
                surface.resized = true;
                surface.logical_w = event.window.data1;
                surface.logical_h = event.window.data2;
                if (!m_opts.resize_scaling && surface.logical_w > 0 && surface.logical_h > 0)
                {
                    m_logical_w = surface.logical_w;
                    m_logical_h = surface.logical_h;
                }
            }
            break;
        case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
        case SDL_EVENT_WINDOW_DISPLAY_SCALE_CHANGED:
            if (event.window.windowID == window_id)
            {
                surface.scale_changed = true;
                surface.scale = m_ctx.PixelDensity();
                m_ctx.Vk().swapchain_rebuild = true;
            }
            break;
        default:
            break;
        }
    }
    input.OnModifiers(ModifiersFromSdl(SDL_GetModState()));
    return true;
}

double VulkanBackend::NowSeconds()
{
    return (double)SDL_GetTicksNS() / 1.0e9;
}

float VulkanBackend::ScaleFactor() const
{
    return m_ctx.PixelDensity();
}

void VulkanBackend::Sleep(double seconds)
{
    if (seconds > 0.0)
        SDL_DelayNS((Uint64)(seconds * 1.0e9));
}

bool VulkanBackend::RebuildBackingBuffer(int device_w, int device_h, Error& err)
{
    err.Clear();
    VulkanState& vk = m_ctx.Vk();
    // The old image may still be sampled by in-flight frames.
    if (!vkh::CheckVk(vkDeviceWaitIdle(vk.device), "vkDeviceWaitIdle", "framebuffer", err))
        return false;
    m_backing.reset();
    m_backing = BackingFramebuffer::Build(m_ctx, m_backing_pass, device_w, device_h, err);
    return m_backing != nullptr;
}

bool VulkanBackend::EnsureSwapchain(Error& err)
{
    VulkanState& vk = m_ctx.Vk();
    ImGui_ImplVulkanH_Window* wd = m_ctx.MainWindow();
    int fb_width = 0, fb_height = 0;
    m_ctx.WindowSizeInPixels(fb_width, fb_height);
    if (fb_width <= 0 || fb_height <= 0)
        return true;
    if (!vk.swapchain_rebuild && wd->Width == fb_width && wd->Height == fb_height)
        return true;

    if (!vkh::CheckVkFrame(vkDeviceWaitIdle(vk.device), "vkDeviceWaitIdle", "context", err))
        return false;
    vk.ResizeMainWindow(wd, fb_width, fb_height);
    if (wd->Swapchain == VK_NULL_HANDLE)
        return err.Set(ErrorKind::DeviceLost, "context", "swapchain recreation failed");

    // Frame slots follow the swapchain image count.
    if ((uint32_t)wd->ImageCount != m_slot_count)
    {
        m_slot_count = (uint32_t)wd->ImageCount;
        for (auto& b : m_layer_buffers)
            b->SetSlotCount(m_slot_count);
    }
    return true;
}

void VulkanBackend::RecordConsoles(VkCommandBuffer cmd, uint32_t slot, Terminal& term, Error& record_err)
{
    VkClearValue clear{};
    clear.color.float32[3] = 1.0f;

    VkRenderPassBeginInfo rp{};
    rp.sType = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
    rp.renderPass = m_backing_pass;
    rp.framebuffer = m_backing->Framebuffer();
    rp.renderArea.extent.width = (uint32_t)m_backing->Width();
    rp.renderArea.extent.height = (uint32_t)m_backing->Height();
    rp.clearValueCount = 1;
    rp.pClearValues = &clear;
    vkCmdBeginRenderPass(cmd, &rp, VK_SUBPASS_CONTENTS_INLINE);

    VkViewport viewport{};
    viewport.width = (float)m_backing->Width();
    viewport.height = (float)m_backing->Height();
    viewport.maxDepth = 1.0f;
    VkRect2D scissor{};
    scissor.extent = rp.renderArea.extent;
    vkCmdSetViewport(cmd, 0, 1, &viewport);
    vkCmdSetScissor(cmd, 0, 1, &scissor);

    const float view_w = (float)(m_opts.resize_scaling ? term.OriginalWidthPixels() : term.WidthPixels());
    const float view_h = (float)(m_opts.resize_scaling ? term.OriginalHeightPixels() : term.HeightPixels());

    for (std::size_t i = 0; i < term.ConsoleCount(); ++i)
    {
        ConsoleLayer& layer = term.Layer(i);
        if (!layer.console || layer.font_index >= term.FontCount())
            continue;
        const Font& font = term.GetFont(layer.font_index);
        if (!font.IsBound())
            continue;

        ConsoleDrawRanges ranges;
        if (!m_layer_buffers[i]->Sync(slot, layer.geometry, layer.built_revision, ranges, record_err))
            continue;
        if (ranges.background_index_count == 0 && ranges.glyph_index_count == 0)
            continue;

        const ShaderId shader = ShaderForConsole(layer.console->Kind(), layer.style);
        vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, m_shaders.Pipeline(shader));
        VkDescriptorSet set = (VkDescriptorSet)font.texture_id;
        vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, m_shaders.ConsoleLayout(), 0, 1, &set, 0, nullptr);

        VkDeviceSize offset = 0;
        vkCmdBindVertexBuffers(cmd, 0, 1, &ranges.vertex_buffer, &offset);
        vkCmdBindIndexBuffer(cmd, ranges.index_buffer, 0, VK_INDEX_TYPE_UINT32);

        const GridSize size = layer.console->CharSize();
        const LayerTransform xf = ComputeLayerTransform(size.width, size.height,
                                                        (float)font.tile_w, (float)font.tile_h,
                                                        view_w, view_h,
                                                        layer.console->OffsetX(), layer.console->OffsetY());
        ConsolePushConstants pc{};
        pc.scale[0] = xf.scale[0];
        pc.scale[1] = xf.scale[1];
        pc.bias[0] = xf.bias[0];
        pc.bias[1] = xf.bias[1];
        pc.texel[0] = 1.0f / (float)font.AtlasWidth();
        pc.texel[1] = 1.0f / (float)font.AtlasHeight();

        const VkShaderStageFlags stages = VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT;
        if (ranges.background_index_count > 0 && ShaderDrawsBackground(shader))
        {
            pc.textured = 0.0f;
            vkCmdPushConstants(cmd, m_shaders.ConsoleLayout(), stages, 0, sizeof(pc), &pc);
            vkCmdDrawIndexed(cmd, ranges.background_index_count, 1, 0, 0, 0);
        }
        if (ranges.glyph_index_count > 0)
        {
            pc.textured = 1.0f;
            vkCmdPushConstants(cmd, m_shaders.ConsoleLayout(), stages, 0, sizeof(pc), &pc);
            vkCmdDrawIndexed(cmd, ranges.glyph_index_count, 1, ranges.glyph_first_index, ranges.glyph_vertex_offset, 0);
        }
    }

    vkCmdEndRenderPass(cmd);
}

void VulkanBackend::RecordComposite(VkCommandBuffer cmd, const FrameParams& params)
{
    ImGui_ImplVulkanH_Window* wd = m_ctx.MainWindow();

    VkViewport viewport{};
    viewport.width = (float)wd->Width;
    viewport.height = (float)wd->Height;
    viewport.maxDepth = 1.0f;
    VkRect2D scissor{};
    scissor.extent.width = (uint32_t)wd->Width;
    scissor.extent.height = (uint32_t)wd->Height;
    vkCmdSetViewport(cmd, 0, 1, &viewport);
    vkCmdSetScissor(cmd, 0, 1, &scissor);

    // The scanlines pass also draws the screen burn; the plain pass is a straight copy.
    const RGB& burn = params.post.burn;
    const bool burning = !(burn == RGB::Black());
    const ShaderId shader = (params.post.scanlines || burning) ? ShaderId::Scanlines : ShaderId::Backing;
    vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, m_shaders.Pipeline(shader));
    VkDescriptorSet set = m_backing->Texture();
    vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, m_shaders.CompositeLayout(), 0, 1, &set, 0, nullptr);

    CompositePushConstants pc{};
    pc.burn[0] = burn.r;
    pc.burn[1] = burn.g;
    pc.burn[2] = burn.b;
    pc.burn[3] = burning ? 1.0f : 0.0f;
    pc.screen[0] = (float)wd->Width;
    pc.screen[1] = (float)wd->Height;
    pc.scanlines = params.post.scanlines ? 1.0f : 0.0f;
    vkCmdPushConstants(cmd, m_shaders.CompositeLayout(), VK_SHADER_STAGE_FRAGMENT_BIT, 0, sizeof(pc), &pc);

    VkDeviceSize offset = 0;
    vkCmdBindVertexBuffers(cmd, 0, 1, &m_quad_buffer, &offset);
    vkCmdDraw(cmd, 6, 1, 0, 0);
}

void VulkanBackend::BuildOverlay(const Terminal& term)
{
    ImGui_ImplVulkan_NewFrame();
    ImGui_ImplSDL3_NewFrame();
    ImGui::NewFrame();

    ImGui::SetNextWindowPos(ImVec2(8.0f, 8.0f), ImGuiCond_Always);
    ImGui::SetNextWindowBgAlpha(0.6f);
    const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize |
                                   ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoFocusOnAppearing |
                                   ImGuiWindowFlags_NoNav | ImGuiWindowFlags_NoInputs;
    if (ImGui::Begin("crtgrid##overlay", nullptr, flags))
    {
        ImGui::Text("%.1f fps (%.2f ms)", term.fps, term.frame_time_ms);
        ImGui::Text("%zu console(s), active %zu", term.ConsoleCount(), term.GetActiveConsole());
        if (m_backing)
            ImGui::Text("backing %dx%d", m_backing->Width(), m_backing->Height());
    }
    ImGui::End();
    ImGui::Render();
}

bool VulkanBackend::RenderFrame(Terminal& term, const FrameParams& params, Error& err)
{
    err.Clear();
    if (!m_backing)
        return err.Set(ErrorKind::Initialization, "framebuffer", "no backing buffer");

    if (!EnsureSwapchain(err))
        return false;
    ImGui_ImplVulkanH_Window* wd = m_ctx.MainWindow();
    int fb_width = 0, fb_height = 0;
    m_ctx.WindowSizeInPixels(fb_width, fb_height);
    if (fb_width <= 0 || fb_height <= 0)
        return true; // minimized

    // Fonts upload lazily the first time a layer draws with them.
    for (std::size_t i = 0; i < term.ConsoleCount(); ++i)
    {
        const std::size_t fi = term.Layer(i).font_index;
        if (fi >= term.FontCount())
            continue;
        VkDescriptorSet set = VK_NULL_HANDLE;
        if (!m_fonts->Bind(fi, term.GetFont(fi), set, err))
            return false;
    }

    while (m_layer_buffers.size() < term.ConsoleCount())
    {
        auto buffers = std::make_unique<ConsoleGpuBuffers>(m_ctx);
        buffers->SetSlotCount(m_slot_count);
        m_layer_buffers.push_back(std::move(buffers));
    }

    ImDrawData* draw_data = nullptr;
    if (m_opts.debug_overlay)
    {
        BuildOverlay(term);
        draw_data = ImGui::GetDrawData();
    }

    Error record_err;
    bool rendered = false;
    VulkanState& vk = m_ctx.Vk();
    const VkResult res = vk.FrameRender(
        wd,
        [&](VkCommandBuffer cmd, uint32_t slot) { RecordConsoles(cmd, slot, term, record_err); },
        [&](VkCommandBuffer cmd, uint32_t) { RecordComposite(cmd, params); },
        draw_data,
        rendered);
    if (!vkh::CheckVkFrame(res, "frame render", "frame", err))
        return false;
    if (!record_err.Ok())
    {
        err = record_err;
        return false;
    }
    if (!rendered)
        return true; // stale swapchain, rebuilt next frame

    return vkh::CheckVkFrame(vk.FramePresent(wd), "frame present", "frame", err);
}
} // namespace crt
