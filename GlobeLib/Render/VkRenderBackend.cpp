#include "VkRenderBackend.hpp"

#include <stdexcept>

#include "PolygonGpuResources.hpp"

VkRenderBackend::VkRenderBackend(VulkanContext* ctx, const PolygonPipelines& pipelines) :
    m_ctx{ctx},
    m_pipelines{pipelines}
{
    if (!m_ctx)
        throw std::invalid_argument("VkRenderBackend::VkRenderBackend(): null VulkanContext");
}

std::unique_ptr<PolygonGeometry> VkRenderBackend::buildGeometry(const PolygonGeometryDesc& desc)
{
    return std::make_unique<PolygonGeometry>(m_tessellator.tessellate(desc));
}

std::unique_ptr<Renderable> VkRenderBackend::buildRenderable(std::unique_ptr<PolygonGeometry> geometry,
                                                             const AppearanceRequirements&    requirements)
{
    if (!geometry)
        throw std::invalid_argument("VkRenderBackend::buildRenderable(): null geometry");

    return std::make_unique<PolygonGpuResources>(m_ctx, m_pipelines, *geometry, requirements);
}

void VkRenderBackend::pipelines(const PolygonPipelines& pipelines) noexcept
{
    m_pipelines = pipelines;
}
