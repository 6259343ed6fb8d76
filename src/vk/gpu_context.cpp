#include "vk/gpu_context.h"

#include "imgui_impl_sdl3.h"

#include <cstdio>

#include "io/image_loader.h"

namespace crt
{
namespace
{
// One live context per process (Vulkan device + SDL video subsystem + ImGui globals).
bool g_ContextLive = false;

std::vector<MonitorInfo> EnumerateMonitors()
{
    std::vector<MonitorInfo> out;
    int count = 0;
    SDL_DisplayID* displays = SDL_GetDisplays(&count);
    if (!displays)
        return out;
    for (int i = 0; i < count; ++i)
    {
        SDL_Rect r{};
        if (!SDL_GetDisplayBounds(displays[i], &r))
            continue;
        MonitorInfo m;
        m.id = (int)displays[i];
        m.x = r.x;
        m.y = r.y;
        m.width = r.w;
        m.height = r.h;
        out.push_back(m);
    }
    SDL_free(displays);
    return out;
}
} // namespace

std::unique_ptr<GpuContext> GpuContext::Create(int width, int height, const std::string& title,
                                               const InitHints& hints, Error& err)
{
    err.Clear();
    if (g_ContextLive)
    {
        err.Set(ErrorKind::Initialization, "context", "a GPU context is already live in this process");
        return nullptr;
    }

    std::unique_ptr<GpuContext> ctx(new GpuContext());
    ctx->m_owns_slot = true;
    g_ContextLive = true;
    if (!ctx->Init(width, height, title, hints, err))
    {
        std::fprintf(stderr, "[vulkan] context creation failed: %s\n", FormatError(err).c_str());
        return nullptr; // destructor releases the partial state
    }
    return ctx;
}

bool GpuContext::Init(int width, int height, const std::string& title, const InitHints& hints, Error& err)
{
    if (width <= 0 || height <= 0)
        return err.Set(ErrorKind::Initialization, "context", "window size must be positive");

    // Setup SDL
    if (!SDL_Init(SDL_INIT_VIDEO))
        return err.Set(ErrorKind::Initialization, "context", std::string("SDL_Init(): ") + SDL_GetError());
    m_sdl_initialized = true;

    // Placement is resolved before any window exists.
    m_monitors = EnumerateMonitors();
    WindowPlacement placement;
    if (!ResolveWindowPlacement(hints.fullscreen, hints.centered, width, height, m_monitors, placement, err))
        return false;

    // Create window with Vulkan graphics context
    SDL_WindowFlags window_flags =
        (SDL_WindowFlags)(SDL_WINDOW_VULKAN |
                          SDL_WINDOW_HIDDEN |
                          SDL_WINDOW_HIGH_PIXEL_DENSITY);
    if (hints.allow_resize)
        window_flags |= SDL_WINDOW_RESIZABLE;
    m_window = SDL_CreateWindow(title.c_str(), width, height, window_flags);
    if (!m_window)
        return err.Set(ErrorKind::Initialization, "context", std::string("SDL_CreateWindow(): ") + SDL_GetError());

    if (placement.fullscreen)
    {
        const SDL_DisplayID id = (SDL_DisplayID)placement.fullscreen_monitor;
        SDL_SetWindowPosition(m_window, SDL_WINDOWPOS_CENTERED_DISPLAY(id), SDL_WINDOWPOS_CENTERED_DISPLAY(id));
        if (!SDL_SetWindowFullscreen(m_window, true))
            std::fprintf(stderr, "[crtgrid] SDL_SetWindowFullscreen(): %s\n", SDL_GetError());
    }
    else if (placement.positioned)
    {
        // Center the decorated window once the window manager reports its borders.
        WindowBorders borders;
        if (SDL_GetWindowBordersSize(m_window, &borders.top, &borders.left, &borders.bottom, &borders.right))
        {
            if (!ResolveWindowPlacement(false, true, width, height, borders, m_monitors, placement, err))
                return false;
        }
        if (placement.positioned)
            SDL_SetWindowPosition(m_window, placement.x, placement.y);
    }

    if (!ApplyIcon(hints))
        std::fprintf(stderr, "[crtgrid] window icon could not be applied\n");

    // Vulkan instance/device
    ImVector<const char*> extensions;
    {
        uint32_t sdl_extensions_count = 0;
        const char* const* sdl_extensions = SDL_Vulkan_GetInstanceExtensions(&sdl_extensions_count);
        if (!sdl_extensions)
            return err.Set(ErrorKind::Initialization, "context",
                           std::string("SDL_Vulkan_GetInstanceExtensions(): ") + SDL_GetError());
        for (uint32_t n = 0; n < sdl_extensions_count; n++)
            extensions.push_back(sdl_extensions[n]);
    }

    VulkanState::Options opts;
    opts.api_version = VK_MAKE_API_VERSION(0, (uint32_t)hints.api_version.major, (uint32_t)hints.api_version.minor, 0);
    opts.srgb = hints.srgb;
    opts.vsync = hints.vsync;
    if (!m_vk.SetupVulkan(extensions, opts, err))
        return false;

    // Create Window Surface
    if (!SDL_Vulkan_CreateSurface(m_window, m_vk.instance, m_vk.allocator, &m_pending_surface))
        return err.Set(ErrorKind::Initialization, "context", std::string("SDL_Vulkan_CreateSurface(): ") + SDL_GetError());

    int pw = 0, ph = 0;
    SDL_GetWindowSizeInPixels(m_window, &pw, &ph);
    if (!m_vk.SetupVulkanWindow(&m_vk.main_window, m_pending_surface, pw, ph, err))
        return false;
    m_pending_surface = VK_NULL_HANDLE; // owned by main_window now
    m_window_setup = true;

    m_upload.device = m_vk.device;
    m_upload.physical = m_vk.physical_device;
    m_upload.queue = m_vk.queue;
    m_upload.queue_family = m_vk.queue_family;
    m_upload.allocator = m_vk.allocator;
    if (!m_upload.Init(err))
        return false;

    m_sampler = vkh::CreateNearestSampler(m_vk.device, m_vk.allocator);
    if (m_sampler == VK_NULL_HANDLE)
        return err.Set(ErrorKind::Initialization, "context", "vkCreateSampler failed");

    {
        VkDescriptorSetLayoutBinding binding{};
        binding.binding = 0;
        binding.descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
        binding.descriptorCount = 1;
        binding.stageFlags = VK_SHADER_STAGE_FRAGMENT_BIT;
        VkDescriptorSetLayoutCreateInfo info{};
        info.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
        info.bindingCount = 1;
        info.pBindings = &binding;
        if (!vkh::CheckVk(vkCreateDescriptorSetLayout(m_vk.device, &info, m_vk.allocator, &m_texture_layout),
                          "vkCreateDescriptorSetLayout", "context", err))
            return false;
    }

    // Dear ImGui (debug overlay + texture registration)
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    m_imgui_context = true;
    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr;
    ImGui::StyleColorsDark();

    if (!ImGui_ImplSDL3_InitForVulkan(m_window))
        return err.Set(ErrorKind::Initialization, "context", "ImGui_ImplSDL3_InitForVulkan failed");
    m_imgui_sdl = true;

    ImGui_ImplVulkanH_Window* wd = &m_vk.main_window;
    ImGui_ImplVulkan_InitInfo init_info = {};
    init_info.ApiVersion = opts.api_version;
    init_info.Instance = m_vk.instance;
    init_info.PhysicalDevice = m_vk.physical_device;
    init_info.Device = m_vk.device;
    init_info.QueueFamily = m_vk.queue_family;
    init_info.Queue = m_vk.queue;
    init_info.PipelineCache = m_vk.pipeline_cache;
    init_info.DescriptorPool = m_vk.descriptor_pool;
    init_info.MinImageCount = m_vk.min_image_count;
    init_info.ImageCount = wd->ImageCount;
    init_info.Allocator = m_vk.allocator;
    init_info.PipelineInfoMain.RenderPass = wd->RenderPass;
    init_info.PipelineInfoMain.Subpass = 0;
    init_info.PipelineInfoMain.MSAASamples = VK_SAMPLE_COUNT_1_BIT;
    init_info.CheckVkResultFn = vkh::CheckVkResultCallback;
    if (!ImGui_ImplVulkan_Init(&init_info))
        return err.Set(ErrorKind::Initialization, "context", "ImGui_ImplVulkan_Init failed");
    m_imgui_vulkan = true;

    SDL_ShowWindow(m_window);
    std::fprintf(stderr, "[vulkan] context ready: %dx%d logical, %dx%d pixels, %zu monitor(s)\n",
                 width, height, pw, ph, m_monitors.size());
    return true;
}

bool GpuContext::ApplyIcon(const InitHints& hints)
{
    WindowIcon loaded;
    const WindowIcon* icon = hints.icon ? &*hints.icon : nullptr;
    if (!icon && !hints.icon_path.empty())
    {
        Error err;
        if (!LoadWindowIcon(hints.icon_path, loaded, err))
        {
            std::fprintf(stderr, "[crtgrid] %s\n", FormatError(err).c_str());
            return false;
        }
        icon = &loaded;
    }
    if (!icon)
        return true;
    if (icon->width <= 0 || icon->height <= 0 ||
        icon->pixels.size() < (size_t)icon->width * (size_t)icon->height * 4u)
        return false;

    SDL_Surface* surface = SDL_CreateSurfaceFrom(icon->width, icon->height, SDL_PIXELFORMAT_RGBA32,
                                                 (void*)icon->pixels.data(), icon->width * 4);
    if (!surface)
        return false;
    const bool ok = SDL_SetWindowIcon(m_window, surface);
    SDL_DestroySurface(surface);
    return ok;
}

GpuContext::~GpuContext()
{
    if (m_vk.device != VK_NULL_HANDLE)
    {
        // The device may already be lost; teardown continues regardless.
        const VkResult res = vkDeviceWaitIdle(m_vk.device);
        if (res != VK_SUCCESS)
            std::fprintf(stderr, "[vulkan] vkDeviceWaitIdle during shutdown: VkResult = %d (ignored)\n", (int)res);
    }

    if (m_imgui_vulkan)
        ImGui_ImplVulkan_Shutdown();
    if (m_imgui_sdl)
        ImGui_ImplSDL3_Shutdown();
    if (m_imgui_context)
        ImGui::DestroyContext();

    if (m_texture_layout != VK_NULL_HANDLE)
        vkDestroyDescriptorSetLayout(m_vk.device, m_texture_layout, m_vk.allocator);
    if (m_sampler != VK_NULL_HANDLE)
        vkDestroySampler(m_vk.device, m_sampler, m_vk.allocator);
    m_upload.Shutdown();

    if (m_window_setup)
        m_vk.CleanupVulkanWindow();
    else if (m_pending_surface != VK_NULL_HANDLE)
        vkDestroySurfaceKHR(m_vk.instance, m_pending_surface, m_vk.allocator);
    m_vk.CleanupVulkan();

    if (m_window)
        SDL_DestroyWindow(m_window);
    if (m_sdl_initialized)
        SDL_Quit();

    if (m_owns_slot)
        g_ContextLive = false;
}

float GpuContext::PixelDensity() const
{
    const float d = m_window ? SDL_GetWindowPixelDensity(m_window) : 1.0f;
    return (d > 0.0f) ? d : 1.0f;
}

void GpuContext::WindowSize(int& w, int& h) const
{
    w = h = 0;
    if (m_window)
        SDL_GetWindowSize(m_window, &w, &h);
}

void GpuContext::WindowSizeInPixels(int& w, int& h) const
{
    w = h = 0;
    if (m_window)
        SDL_GetWindowSizeInPixels(m_window, &w, &h);
}

VkDescriptorSet GpuContext::AddTexture(VkImageView view)
{
    return ImGui_ImplVulkan_AddTexture(m_sampler, view, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
}

void GpuContext::RemoveTexture(VkDescriptorSet set)
{
    if (set != VK_NULL_HANDLE)
        ImGui_ImplVulkan_RemoveTexture(set);
}
} // namespace crt
