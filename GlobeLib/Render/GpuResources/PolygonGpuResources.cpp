//============================================================
// PolygonGpuResources.cpp
//============================================================
#include "PolygonGpuResources.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "Material.hpp"

namespace
{
    void splitDouble(double value, float& high, float& low) noexcept
    {
        high = static_cast<float>(value);
        low  = static_cast<float>(value - static_cast<double>(high));
    }
} // namespace

// -------------------------------------------------------------
// Constructor / Destructor
// -------------------------------------------------------------
PolygonGpuResources::PolygonGpuResources(VulkanContext*                ctx,
                                         const PolygonPipelines&       pipelines,
                                         const PolygonGeometry&        geometry,
                                         const AppearanceRequirements& requirements) :
    m_ctx{ctx},
    m_pipelines{pipelines},
    m_blend{requirements.translucent}
{
    if (!m_ctx || !m_ctx->device)
        throw std::invalid_argument("PolygonGpuResources::PolygonGpuResources(): no Vulkan device");

    for (int i = 0; i < 3; ++i)
        splitDouble(geometry.center[i], m_push.centerHigh[i], m_push.centerLow[i]);

    upload(geometry);
}

PolygonGpuResources::~PolygonGpuResources() noexcept
{
    destroy();
}

void PolygonGpuResources::destroy() noexcept
{
    m_vertexBuffer.destroy();
    m_indexBuffer.destroy();
    m_indexCount = 0;
    m_material.reset();
}

// -------------------------------------------------------------
// Upload
// -------------------------------------------------------------
void PolygonGpuResources::upload(const PolygonGeometry& geometry)
{
    if (geometry.indices.empty())
        return;

    const bool hasSt = geometry.st.size() == geometry.positions.size();

    std::vector<PolygonVertex> vertices;
    vertices.reserve(geometry.positions.size());
    for (std::size_t i = 0; i < geometry.positions.size(); ++i)
    {
        PolygonVertex v{};
        v.position = glm::vec3(geometry.positions[i] - geometry.center);
        v.st       = hasSt ? geometry.st[i] : glm::vec2(0.0f);
        vertices.push_back(v);
    }

    const VkDeviceSize vbSize = VkDeviceSize(sizeof(PolygonVertex)) * VkDeviceSize(vertices.size());
    const VkDeviceSize ibSize = VkDeviceSize(sizeof(uint32_t)) * VkDeviceSize(geometry.indices.size());

    try
    {
        m_vertexBuffer.create(m_ctx->device, m_ctx->physicalDevice, vbSize, VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);
        m_vertexBuffer.upload(vertices.data(), vbSize);

        m_indexBuffer.create(m_ctx->device, m_ctx->physicalDevice, ibSize, VK_BUFFER_USAGE_INDEX_BUFFER_BIT);
        m_indexBuffer.upload(geometry.indices.data(), ibSize);
    }
    catch (const std::exception& e)
    {
        std::cerr << "PolygonGpuResources::upload: " << e.what() << '\n';
        destroy();
        throw;
    }

    m_indexCount = static_cast<uint32_t>(geometry.indices.size());
}

// -------------------------------------------------------------
// Frame
// -------------------------------------------------------------
void PolygonGpuResources::material(std::shared_ptr<const Material> material)
{
    m_material = std::move(material);
    if (!m_material)
        return;

    m_push.color = glm::vec4(m_material->baseColor(), m_material->opacity());
}

void PolygonGpuResources::draw(const RenderFrameContext& fc)
{
    if (!fc.cmd || m_indexCount == 0 || !m_vertexBuffer.valid() || !m_indexBuffer.valid())
        return;

    // The material can turn translucent without a rebuild.
    const bool       blend    = m_blend || (m_material && m_material->translucent());
    const VkPipeline pipeline = blend ? m_pipelines.translucent : m_pipelines.opaque;
    if (!pipeline || !m_pipelines.layout)
        return;

    vkCmdBindPipeline(fc.cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, pipeline);

    vkCmdPushConstants(fc.cmd,
                       m_pipelines.layout,
                       VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT,
                       0,
                       sizeof(PolygonPushConstants),
                       &m_push);

    VkBuffer     vb     = m_vertexBuffer.buffer();
    VkDeviceSize offset = 0;
    vkCmdBindVertexBuffers(fc.cmd, 0, 1, &vb, &offset);
    vkCmdBindIndexBuffer(fc.cmd, m_indexBuffer.buffer(), 0, VK_INDEX_TYPE_UINT32);

    vkCmdDrawIndexed(fc.cmd, m_indexCount, 1, 0, 0, 0);
}
