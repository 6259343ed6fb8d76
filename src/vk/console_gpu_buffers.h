// Per-layer vertex/index buffers, one set per frame-in-flight slot.
//
// Each slot is re-uploaded only when the layer's geometry revision differs from the one the
// slot last received, so a static console costs no uploads after the first frames.

#pragma once

#include <vulkan/vulkan.h>

#include <cstdint>
#include <vector>

#include "core/errors.h"
#include "core/vertex_builder.h"

namespace crt
{
class GpuContext;

struct ConsoleDrawRanges
{
    VkBuffer vertex_buffer = VK_NULL_HANDLE;
    VkBuffer index_buffer = VK_NULL_HANDLE;

    uint32_t background_index_count = 0;
    uint32_t glyph_first_index = 0;
    uint32_t glyph_index_count = 0;
    int32_t  glyph_vertex_offset = 0;
};

class ConsoleGpuBuffers
{
public:
    explicit ConsoleGpuBuffers(GpuContext& ctx) : m_ctx(ctx) {}
    ~ConsoleGpuBuffers();

    ConsoleGpuBuffers(const ConsoleGpuBuffers&) = delete;
    ConsoleGpuBuffers& operator=(const ConsoleGpuBuffers&) = delete;

    // Reallocates the slot table (call with the device idle).
    void SetSlotCount(uint32_t count);
    uint32_t SlotCount() const { return (uint32_t)m_slots.size(); }

    bool Sync(uint32_t slot, const ConsoleGeometry& geometry, uint64_t revision, ConsoleDrawRanges& out, Error& err);

    uint64_t UploadCount() const { return m_uploads; }

private:
    struct Buffer
    {
        VkBuffer       buffer = VK_NULL_HANDLE;
        VkDeviceMemory memory = VK_NULL_HANDLE;
        void*          mapped = nullptr;
        VkDeviceSize   capacity = 0;
    };

    struct Slot
    {
        Buffer            vertices;
        Buffer            indices;
        uint64_t          revision = 0;
        ConsoleDrawRanges ranges;
    };

    bool Reserve(Buffer& b, VkDeviceSize bytes, VkBufferUsageFlags usage, Error& err);
    void Release(Buffer& b);

    GpuContext&       m_ctx;
    std::vector<Slot> m_slots;
    uint64_t          m_uploads = 0;
};
} // namespace crt
