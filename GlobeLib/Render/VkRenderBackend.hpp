#pragma once

#include <memory>

#include "PolygonTessellator.hpp"
#include "Renderable.hpp"
#include "VulkanContext.hpp"

/// RenderBackend that tessellates on the CPU and uploads to Vulkan buffers.
class VkRenderBackend final : public RenderBackend
{
public:
    /// @param ctx Device context; must outlive the backend and every renderable it builds.
    /// @throws std::invalid_argument if ctx is null.
    VkRenderBackend(VulkanContext* ctx, const PolygonPipelines& pipelines);

    std::unique_ptr<PolygonGeometry> buildGeometry(const PolygonGeometryDesc& desc) override;

    std::unique_ptr<Renderable> buildRenderable(std::unique_ptr<PolygonGeometry> geometry,
                                                const AppearanceRequirements&    requirements) override;

    void pipelines(const PolygonPipelines& pipelines) noexcept;

private:
    VulkanContext*     m_ctx = nullptr;
    PolygonPipelines   m_pipelines;
    PolygonTessellator m_tessellator;
};
