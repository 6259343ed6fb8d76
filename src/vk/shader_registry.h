// Compiled shader table + graphics pipelines.
//
// All six GLSL pairs are compiled to SPIR-V with shaderc at initialization; a single failure
// fails the whole registry. Console pipelines target the backing render pass, composite
// pipelines (backing, scanlines) target the swapchain render pass.

#pragma once

#include <vulkan/vulkan.h>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "core/errors.h"
#include "core/shader_table.h"

namespace crt
{
struct CompiledShader
{
    std::vector<uint32_t> vertex;
    std::vector<uint32_t> fragment;
};

// GLSL -> SPIR-V. Returns false and fills `log` on failure.
bool CompileGlslToSpirv(const std::string& source, const std::string& filename, bool fragment,
                        std::vector<uint32_t>& out, std::string& log);

class ShaderRegistry
{
public:
    struct PipelineInfo
    {
        VkDevice                     device = VK_NULL_HANDLE;
        const VkAllocationCallbacks* allocator = nullptr;
        VkPipelineCache              cache = VK_NULL_HANDLE;
        VkDescriptorSetLayout        texture_layout = VK_NULL_HANDLE;
        VkRenderPass                 backing_pass = VK_NULL_HANDLE;
        VkRenderPass                 present_pass = VK_NULL_HANDLE;
    };

    ShaderRegistry() = default;
    ~ShaderRegistry();

    ShaderRegistry(const ShaderRegistry&) = delete;
    ShaderRegistry& operator=(const ShaderRegistry&) = delete;

    bool CompileAll(Error& err);
    bool IsCompiled() const { return m_compiled; }
    const CompiledShader& Compiled(ShaderId id) const { return m_shaders[(std::size_t)id]; }

    bool BuildPipelines(const PipelineInfo& info, Error& err);
    void DestroyPipelines();

    VkPipeline Pipeline(ShaderId id) const { return m_pipelines[(std::size_t)id]; }
    VkPipelineLayout ConsoleLayout() const { return m_console_layout; }
    VkPipelineLayout CompositeLayout() const { return m_composite_layout; }

private:
    bool BuildPipeline(ShaderId id, VkRenderPass pass, VkPipelineLayout layout, bool console, Error& err);

    std::array<CompiledShader, kShaderCount> m_shaders;
    bool                                     m_compiled = false;

    PipelineInfo                         m_info;
    VkPipelineLayout                     m_console_layout = VK_NULL_HANDLE;
    VkPipelineLayout                     m_composite_layout = VK_NULL_HANDLE;
    std::array<VkPipeline, kShaderCount> m_pipelines{};
};

// Full-screen quad vertex for the composite pass.
struct QuadVertex
{
    float pos[2];
    float uv[2];
};
} // namespace crt
