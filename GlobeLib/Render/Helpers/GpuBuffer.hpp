#pragma once

#include <cstdint>
#include <vulkan/vulkan.h>

/**
 * RAII wrapper around a host-visible Vulkan buffer and its memory.
 *
 * - Default constructed buffers own nothing.
 * - Explicit create() / destroy(); destroy() is idempotent.
 * - Move-only.
 *
 * Intended for static geometry written once from the CPU: memory is always
 * HOST_VISIBLE | HOST_COHERENT and upload() maps, copies and unmaps.
 */
class GpuBuffer
{
public:
    GpuBuffer() = default;
    ~GpuBuffer();

    GpuBuffer(const GpuBuffer&)            = delete;
    GpuBuffer& operator=(const GpuBuffer&) = delete;
    GpuBuffer(GpuBuffer&& other) noexcept;
    GpuBuffer& operator=(GpuBuffer&& other) noexcept;

    /// @throws std::runtime_error if the buffer or its memory cannot be created.
    void create(VkDevice device, VkPhysicalDevice physicalDevice, VkDeviceSize size, VkBufferUsageFlags usage);

    void destroy() noexcept;

    /// Copy `size` bytes into the buffer at `offset`.
    /// @throws std::runtime_error if the range does not fit or mapping fails.
    void upload(const void* data, VkDeviceSize size, VkDeviceSize offset = 0);

    [[nodiscard]] bool valid() const
    {
        return m_buffer != VK_NULL_HANDLE;
    }

    [[nodiscard]] VkBuffer buffer() const
    {
        return m_buffer;
    }

    [[nodiscard]] VkDeviceSize size() const
    {
        return m_size;
    }

private:
    static uint32_t findMemoryType(VkPhysicalDevice phys, uint32_t bits, VkMemoryPropertyFlags flags);
    void            moveFrom(GpuBuffer& other) noexcept;

private:
    VkDevice       m_device = VK_NULL_HANDLE;
    VkBuffer       m_buffer = VK_NULL_HANDLE;
    VkDeviceMemory m_memory = VK_NULL_HANDLE;
    VkDeviceSize   m_size   = 0;
};
