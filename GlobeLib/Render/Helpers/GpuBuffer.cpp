#include "GpuBuffer.hpp"

#include <cstring>
#include <stdexcept>
#include <string>

namespace
{
    constexpr VkMemoryPropertyFlags kHostMemory =
        VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT;
} // namespace

// --------------------------------------------------------
// Helpers
// --------------------------------------------------------

uint32_t GpuBuffer::findMemoryType(VkPhysicalDevice phys, uint32_t bits, VkMemoryPropertyFlags flags)
{
    VkPhysicalDeviceMemoryProperties mem{};
    vkGetPhysicalDeviceMemoryProperties(phys, &mem);

    for (uint32_t i = 0; i < mem.memoryTypeCount; i++)
    {
        if ((bits & (1u << i)) && (mem.memoryTypes[i].propertyFlags & flags) == flags)
            return i;
    }

    return UINT32_MAX;
}

// --------------------------------------------------------
// Create / destroy
// --------------------------------------------------------

void GpuBuffer::create(VkDevice device, VkPhysicalDevice physicalDevice, VkDeviceSize size, VkBufferUsageFlags usage)
{
    destroy();

    if (!device || !physicalDevice)
        throw std::runtime_error("GpuBuffer::create(): no device");
    if (size == 0)
        throw std::runtime_error("GpuBuffer::create(): zero-sized buffer");

    m_device = device;
    m_size   = size;

    VkBufferCreateInfo bi{};
    bi.sType       = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    bi.size        = size;
    bi.usage       = usage;
    bi.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    VkResult res = vkCreateBuffer(m_device, &bi, nullptr, &m_buffer);
    if (res != VK_SUCCESS)
    {
        m_buffer = VK_NULL_HANDLE;
        destroy();
        throw std::runtime_error("GpuBuffer::create(): vkCreateBuffer failed (" + std::to_string(res) + ")");
    }

    VkMemoryRequirements req{};
    vkGetBufferMemoryRequirements(m_device, m_buffer, &req);

    const uint32_t memType = findMemoryType(physicalDevice, req.memoryTypeBits, kHostMemory);
    if (memType == UINT32_MAX)
    {
        destroy();
        throw std::runtime_error("GpuBuffer::create(): no host-visible memory type");
    }

    VkMemoryAllocateInfo ai{};
    ai.sType           = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    ai.allocationSize  = req.size;
    ai.memoryTypeIndex = memType;

    res = vkAllocateMemory(m_device, &ai, nullptr, &m_memory);
    if (res != VK_SUCCESS)
    {
        m_memory = VK_NULL_HANDLE;
        destroy();
        throw std::runtime_error("GpuBuffer::create(): vkAllocateMemory failed (" + std::to_string(res) + ")");
    }

    res = vkBindBufferMemory(m_device, m_buffer, m_memory, 0);
    if (res != VK_SUCCESS)
    {
        destroy();
        throw std::runtime_error("GpuBuffer::create(): vkBindBufferMemory failed (" + std::to_string(res) + ")");
    }
}

void GpuBuffer::destroy() noexcept
{
    if (!m_device)
        return;

    if (m_buffer)
    {
        vkDestroyBuffer(m_device, m_buffer, nullptr);
        m_buffer = VK_NULL_HANDLE;
    }

    if (m_memory)
    {
        vkFreeMemory(m_device, m_memory, nullptr);
        m_memory = VK_NULL_HANDLE;
    }

    m_device = VK_NULL_HANDLE;
    m_size   = 0;
}

// --------------------------------------------------------
// Upload
// --------------------------------------------------------

void GpuBuffer::upload(const void* data, VkDeviceSize size, VkDeviceSize offset)
{
    if (!data || size == 0)
        return;

    if (!valid())
        throw std::runtime_error("GpuBuffer::upload(): buffer not created");

    if (offset + size > m_size)
        throw std::runtime_error("GpuBuffer::upload(): range exceeds buffer size");

    void*    ptr = nullptr;
    VkResult res = vkMapMemory(m_device, m_memory, offset, size, 0, &ptr);
    if (res != VK_SUCCESS || !ptr)
        throw std::runtime_error("GpuBuffer::upload(): vkMapMemory failed");

    std::memcpy(ptr, data, static_cast<std::size_t>(size));

    vkUnmapMemory(m_device, m_memory);
}

// --------------------------------------------------------
// Move / dtor
// --------------------------------------------------------

GpuBuffer::GpuBuffer(GpuBuffer&& o) noexcept
{
    moveFrom(o);
}

GpuBuffer& GpuBuffer::operator=(GpuBuffer&& o) noexcept
{
    if (this != &o)
    {
        destroy();
        moveFrom(o);
    }
    return *this;
}

void GpuBuffer::moveFrom(GpuBuffer& o) noexcept
{
    m_device = o.m_device;
    m_buffer = o.m_buffer;
    m_memory = o.m_memory;
    m_size   = o.m_size;

    o.m_device = VK_NULL_HANDLE;
    o.m_buffer = VK_NULL_HANDLE;
    o.m_memory = VK_NULL_HANDLE;
    o.m_size   = 0;
}

GpuBuffer::~GpuBuffer()
{
    destroy();
}
