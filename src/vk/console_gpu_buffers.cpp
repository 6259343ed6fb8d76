#include "vk/console_gpu_buffers.h"

#include <cstring>

#include "vk/gpu_context.h"
#include "vk/vk_helpers.h"

namespace crt
{
ConsoleGpuBuffers::~ConsoleGpuBuffers()
{
    SetSlotCount(0);
}

void ConsoleGpuBuffers::SetSlotCount(uint32_t count)
{
    for (Slot& s : m_slots)
    {
        Release(s.vertices);
        Release(s.indices);
    }
    m_slots.clear();
    m_slots.resize(count);
}

void ConsoleGpuBuffers::Release(Buffer& b)
{
    VulkanState& vk = m_ctx.Vk();
    if (b.mapped)
        vkUnmapMemory(vk.device, b.memory);
    if (b.buffer != VK_NULL_HANDLE)
        vkDestroyBuffer(vk.device, b.buffer, vk.allocator);
    if (b.memory != VK_NULL_HANDLE)
        vkFreeMemory(vk.device, b.memory, vk.allocator);
    b = Buffer{};
}

bool ConsoleGpuBuffers::Reserve(Buffer& b, VkDeviceSize bytes, VkBufferUsageFlags usage, Error& err)
{
    if (bytes == 0)
        bytes = 256;
    if (b.buffer != VK_NULL_HANDLE && b.capacity >= bytes)
        return true;
    Release(b);

    // Grow with headroom so a console that keeps filling up does not reallocate every frame.
    VkDeviceSize capacity = 4096;
    while (capacity < bytes)
        capacity *= 2;

    VulkanState& vk = m_ctx.Vk();
    const VkResult res = vkh::CreateBuffer(vk.device, vk.allocator, vk.physical_device, capacity, usage,
                                           VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT,
                                           b.buffer, b.memory);
    if (!vkh::CheckVk(res, "console buffer", "console", err))
    {
        Release(b);
        return false;
    }
    if (!vkh::CheckVk(vkMapMemory(vk.device, b.memory, 0, capacity, 0, &b.mapped), "vkMapMemory", "console", err))
    {
        b.mapped = nullptr;
        Release(b);
        return false;
    }
    b.capacity = capacity;
    return true;
}

bool ConsoleGpuBuffers::Sync(uint32_t slot, const ConsoleGeometry& geometry, uint64_t revision,
                             ConsoleDrawRanges& out, Error& err)
{
    if (slot >= m_slots.size())
        return err.Set(ErrorKind::Initialization, "console", "frame slot out of range");
    Slot& s = m_slots[slot];
    if (s.revision == revision && s.vertices.buffer != VK_NULL_HANDLE)
    {
        out = s.ranges;
        return true;
    }

    const VertexBatch& bg = geometry.background;
    const VertexBatch& fg = geometry.glyphs;
    const std::size_t vcount = bg.vertices.size() + fg.vertices.size();
    const std::size_t icount = bg.indices.size() + fg.indices.size();

    if (!Reserve(s.vertices, (VkDeviceSize)(vcount * sizeof(ConsoleVertex)), VK_BUFFER_USAGE_VERTEX_BUFFER_BIT, err) ||
        !Reserve(s.indices, (VkDeviceSize)(icount * sizeof(uint32_t)), VK_BUFFER_USAGE_INDEX_BUFFER_BIT, err))
        return false;

    auto* vdst = (unsigned char*)s.vertices.mapped;
    if (!bg.vertices.empty())
        std::memcpy(vdst, bg.vertices.data(), bg.vertices.size() * sizeof(ConsoleVertex));
    if (!fg.vertices.empty())
        std::memcpy(vdst + bg.vertices.size() * sizeof(ConsoleVertex), fg.vertices.data(),
                    fg.vertices.size() * sizeof(ConsoleVertex));

    auto* idst = (unsigned char*)s.indices.mapped;
    if (!bg.indices.empty())
        std::memcpy(idst, bg.indices.data(), bg.indices.size() * sizeof(uint32_t));
    if (!fg.indices.empty())
        std::memcpy(idst + bg.indices.size() * sizeof(uint32_t), fg.indices.data(),
                    fg.indices.size() * sizeof(uint32_t));

    s.ranges.vertex_buffer = s.vertices.buffer;
    s.ranges.index_buffer = s.indices.buffer;
    s.ranges.background_index_count = (uint32_t)bg.indices.size();
    s.ranges.glyph_first_index = (uint32_t)bg.indices.size();
    s.ranges.glyph_index_count = (uint32_t)fg.indices.size();
    s.ranges.glyph_vertex_offset = (int32_t)bg.vertices.size();
    s.revision = revision;
    ++m_uploads;

    out = s.ranges;
    return true;
}
} // namespace crt
