#include "vk/shader_registry.h"

#include <shaderc/shaderc.hpp>

#include <cstddef>
#include <cstdio>

#include "core/vertex_builder.h"
#include "vk/vk_helpers.h"

namespace crt
{
bool CompileGlslToSpirv(const std::string& source, const std::string& filename, bool fragment,
                        std::vector<uint32_t>& out, std::string& log)
{
    out.clear();
    log.clear();

    shaderc::Compiler compiler;
    shaderc::CompileOptions options;
    options.SetTargetEnvironment(shaderc_target_env_vulkan, shaderc_env_version_vulkan_1_2);
    options.SetOptimizationLevel(shaderc_optimization_level_performance);

    const shaderc_shader_kind kind = fragment ? shaderc_glsl_fragment_shader : shaderc_glsl_vertex_shader;
    shaderc::SpvCompilationResult result = compiler.CompileGlslToSpv(source, kind, filename.c_str(), options);
    if (result.GetCompilationStatus() != shaderc_compilation_status_success)
    {
        log = result.GetErrorMessage();
        return false;
    }
    out.assign(result.cbegin(), result.cend());
    return true;
}

ShaderRegistry::~ShaderRegistry()
{
    DestroyPipelines();
}

bool ShaderRegistry::CompileAll(Error& err)
{
    m_compiled = false;
    std::array<CompiledShader, kShaderCount> compiled;
    for (std::size_t i = 0; i < kShaderCount; ++i)
    {
        const ShaderSource& src = GetShaderSource((ShaderId)i);
        std::string log;
        if (!CompileGlslToSpirv(src.vertex, std::string(src.name) + ".vert", false, compiled[i].vertex, log) ||
            !CompileGlslToSpirv(src.fragment, std::string(src.name) + ".frag", true, compiled[i].fragment, log))
        {
            std::fprintf(stderr, "[shader] %s: %s\n", src.name, log.c_str());
            return err.Set(ErrorKind::Initialization, "shader", std::string(src.name) + ": " + log);
        }
    }
    m_shaders = std::move(compiled);
    m_compiled = true;
    std::fprintf(stderr, "[shader] compiled %zu shader pairs (table v%d)\n", kShaderCount, kShaderTableVersion);
    return true;
}

static VkShaderModule CreateModule(VkDevice device, const VkAllocationCallbacks* allocator, const std::vector<uint32_t>& code)
{
    VkShaderModuleCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
    info.codeSize = code.size() * sizeof(uint32_t);
    info.pCode = code.data();
    VkShaderModule module = VK_NULL_HANDLE;
    if (vkCreateShaderModule(device, &info, allocator, &module) != VK_SUCCESS)
        return VK_NULL_HANDLE;
    return module;
}

bool ShaderRegistry::BuildPipelines(const PipelineInfo& info, Error& err)
{
    if (!m_compiled)
        return err.Set(ErrorKind::Initialization, "shader", "pipelines requested before shader compilation");
    DestroyPipelines();
    m_info = info;

    // Both layouts: one combined image sampler at set 0 + a 32-byte push constant block.
    {
        VkPushConstantRange range{};
        range.stageFlags = VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT;
        range.offset = 0;
        range.size = sizeof(ConsolePushConstants);

        VkPipelineLayoutCreateInfo li{};
        li.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
        li.setLayoutCount = 1;
        li.pSetLayouts = &info.texture_layout;
        li.pushConstantRangeCount = 1;
        li.pPushConstantRanges = &range;
        if (!vkh::CheckVk(vkCreatePipelineLayout(info.device, &li, info.allocator, &m_console_layout),
                          "vkCreatePipelineLayout(console)", "shader", err))
            return false;

        range.stageFlags = VK_SHADER_STAGE_FRAGMENT_BIT;
        range.size = sizeof(CompositePushConstants);
        if (!vkh::CheckVk(vkCreatePipelineLayout(info.device, &li, info.allocator, &m_composite_layout),
                          "vkCreatePipelineLayout(composite)", "shader", err))
            return false;
    }

    for (std::size_t i = 0; i < kShaderCount; ++i)
    {
        const ShaderId id = (ShaderId)i;
        const bool composite = (id == ShaderId::Backing || id == ShaderId::Scanlines);
        const bool ok = composite
            ? BuildPipeline(id, info.present_pass, m_composite_layout, false, err)
            : BuildPipeline(id, info.backing_pass, m_console_layout, true, err);
        if (!ok)
        {
            DestroyPipelines();
            return false;
        }
    }
    return true;
}

bool ShaderRegistry::BuildPipeline(ShaderId id, VkRenderPass pass, VkPipelineLayout layout, bool console, Error& err)
{
    const CompiledShader& sh = m_shaders[(std::size_t)id];
    VkShaderModule vert = CreateModule(m_info.device, m_info.allocator, sh.vertex);
    VkShaderModule frag = CreateModule(m_info.device, m_info.allocator, sh.fragment);
    if (vert == VK_NULL_HANDLE || frag == VK_NULL_HANDLE)
    {
        if (vert != VK_NULL_HANDLE)
            vkDestroyShaderModule(m_info.device, vert, m_info.allocator);
        if (frag != VK_NULL_HANDLE)
            vkDestroyShaderModule(m_info.device, frag, m_info.allocator);
        return err.Set(ErrorKind::Initialization, "shader",
                       std::string("vkCreateShaderModule failed for ") + GetShaderSource(id).name);
    }

    VkPipelineShaderStageCreateInfo stages[2] = {};
    stages[0].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    stages[0].stage = VK_SHADER_STAGE_VERTEX_BIT;
    stages[0].module = vert;
    stages[0].pName = "main";
    stages[1].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    stages[1].stage = VK_SHADER_STAGE_FRAGMENT_BIT;
    stages[1].module = frag;
    stages[1].pName = "main";

    VkVertexInputBindingDescription binding{};
    VkVertexInputAttributeDescription attrs[3] = {};
    uint32_t attr_count = 0;
    binding.binding = 0;
    binding.inputRate = VK_VERTEX_INPUT_RATE_VERTEX;
    if (console)
    {
        binding.stride = sizeof(ConsoleVertex);
        attrs[0] = { 0, 0, VK_FORMAT_R32G32_SFLOAT, (uint32_t)offsetof(ConsoleVertex, x) };
        attrs[1] = { 1, 0, VK_FORMAT_R32G32_SFLOAT, (uint32_t)offsetof(ConsoleVertex, u) };
        attrs[2] = { 2, 0, VK_FORMAT_R32G32B32A32_SFLOAT, (uint32_t)offsetof(ConsoleVertex, r) };
        attr_count = 3;
    }
    else
    {
        binding.stride = sizeof(QuadVertex);
        attrs[0] = { 0, 0, VK_FORMAT_R32G32_SFLOAT, (uint32_t)offsetof(QuadVertex, pos) };
        attrs[1] = { 1, 0, VK_FORMAT_R32G32_SFLOAT, (uint32_t)offsetof(QuadVertex, uv) };
        attr_count = 2;
    }

    VkPipelineVertexInputStateCreateInfo vertex_input{};
    vertex_input.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
    vertex_input.vertexBindingDescriptionCount = 1;
    vertex_input.pVertexBindingDescriptions = &binding;
    vertex_input.vertexAttributeDescriptionCount = attr_count;
    vertex_input.pVertexAttributeDescriptions = attrs;

    VkPipelineInputAssemblyStateCreateInfo input_assembly{};
    input_assembly.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
    input_assembly.topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;

    // Viewport/scissor are dynamic so pipelines survive backing and swapchain resizes.
    VkPipelineViewportStateCreateInfo viewport_state{};
    viewport_state.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
    viewport_state.viewportCount = 1;
    viewport_state.scissorCount = 1;

    VkDynamicState dynamic_states[] = { VK_DYNAMIC_STATE_VIEWPORT, VK_DYNAMIC_STATE_SCISSOR };
    VkPipelineDynamicStateCreateInfo dynamic_state{};
    dynamic_state.sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
    dynamic_state.dynamicStateCount = 2;
    dynamic_state.pDynamicStates = dynamic_states;

    VkPipelineRasterizationStateCreateInfo rasterizer{};
    rasterizer.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
    rasterizer.polygonMode = VK_POLYGON_MODE_FILL;
    rasterizer.lineWidth = 1.0f;
    rasterizer.cullMode = VK_CULL_MODE_NONE;
    rasterizer.frontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE;

    VkPipelineMultisampleStateCreateInfo multisampling{};
    multisampling.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
    multisampling.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

    VkPipelineColorBlendAttachmentState blend{};
    blend.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT |
                           VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
    if (console)
    {
        // Layers stack bottom to top over whatever is already in the backing image.
        blend.blendEnable = VK_TRUE;
        blend.srcColorBlendFactor = VK_BLEND_FACTOR_SRC_ALPHA;
        blend.dstColorBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
        blend.colorBlendOp = VK_BLEND_OP_ADD;
        blend.srcAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
        blend.dstAlphaBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
        blend.alphaBlendOp = VK_BLEND_OP_ADD;
    }

    VkPipelineColorBlendStateCreateInfo color_blending{};
    color_blending.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
    color_blending.attachmentCount = 1;
    color_blending.pAttachments = &blend;

    VkGraphicsPipelineCreateInfo pi{};
    pi.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
    pi.stageCount = 2;
    pi.pStages = stages;
    pi.pVertexInputState = &vertex_input;
    pi.pInputAssemblyState = &input_assembly;
    pi.pViewportState = &viewport_state;
    pi.pRasterizationState = &rasterizer;
    pi.pMultisampleState = &multisampling;
    pi.pColorBlendState = &color_blending;
    pi.pDynamicState = &dynamic_state;
    pi.layout = layout;
    pi.renderPass = pass;
    pi.subpass = 0;

    VkPipeline pipeline = VK_NULL_HANDLE;
    const VkResult res = vkCreateGraphicsPipelines(m_info.device, m_info.cache, 1, &pi, m_info.allocator, &pipeline);
    vkDestroyShaderModule(m_info.device, vert, m_info.allocator);
    vkDestroyShaderModule(m_info.device, frag, m_info.allocator);
    if (!vkh::CheckVk(res, "vkCreateGraphicsPipelines", "shader", err))
        return false;
    m_pipelines[(std::size_t)id] = pipeline;
    return true;
}

void ShaderRegistry::DestroyPipelines()
{
    if (m_info.device == VK_NULL_HANDLE)
        return;
    for (VkPipeline& p : m_pipelines)
    {
        if (p != VK_NULL_HANDLE)
            vkDestroyPipeline(m_info.device, p, m_info.allocator);
        p = VK_NULL_HANDLE;
    }
    if (m_console_layout != VK_NULL_HANDLE)
        vkDestroyPipelineLayout(m_info.device, m_console_layout, m_info.allocator);
    if (m_composite_layout != VK_NULL_HANDLE)
        vkDestroyPipelineLayout(m_info.device, m_composite_layout, m_info.allocator);
    m_console_layout = VK_NULL_HANDLE;
    m_composite_layout = VK_NULL_HANDLE;
}
} // namespace crt
