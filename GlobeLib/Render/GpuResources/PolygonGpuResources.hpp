//============================================================
// PolygonGpuResources.hpp
//============================================================
#pragma once

#include <glm/glm.hpp>
#include <memory>

#include "GpuBuffer.hpp"
#include "PolygonGeometry.hpp"
#include "Renderable.hpp"
#include "VulkanContext.hpp"

class Material;

/// Push-constant block shared by both polygon pipelines.
///
/// Positions are uploaded relative to the geometry center; the center is
/// split into high and low float parts so the vertex shader can rebuild it
/// relative to the eye without losing precision.
struct PolygonPushConstants
{
    glm::vec4 centerHigh{0.0f};
    glm::vec4 centerLow{0.0f};
    glm::vec4 color{1.0f};
};

/// Interleaved vertex: binding 0, location 0 = position, location 1 = st.
struct PolygonVertex
{
    glm::vec3 position;
    glm::vec2 st;
};

class PolygonGpuResources final : public Renderable
{
public:
    /// Uploads `geometry` immediately.
    /// @throws std::runtime_error if a buffer cannot be created.
    PolygonGpuResources(VulkanContext*                ctx,
                        const PolygonPipelines&       pipelines,
                        const PolygonGeometry&        geometry,
                        const AppearanceRequirements& requirements);
    ~PolygonGpuResources() noexcept override;

    PolygonGpuResources(const PolygonGpuResources&)            = delete;
    PolygonGpuResources& operator=(const PolygonGpuResources&) = delete;
    PolygonGpuResources(PolygonGpuResources&&)                 = delete;
    PolygonGpuResources& operator=(PolygonGpuResources&&)      = delete;

    void material(std::shared_ptr<const Material> material) override;
    void draw(const RenderFrameContext& fc) override;
    void destroy() noexcept override;

    const GpuBuffer& vertexBuffer() const
    {
        return m_vertexBuffer;
    }

    const GpuBuffer& indexBuffer() const
    {
        return m_indexBuffer;
    }

    uint32_t indexCount() const
    {
        return m_indexCount;
    }

private:
    void upload(const PolygonGeometry& geometry);

private:
    VulkanContext*   m_ctx = nullptr;
    PolygonPipelines m_pipelines;

    GpuBuffer m_vertexBuffer; // PolygonVertex
    GpuBuffer m_indexBuffer;  // uint32, 3 per triangle
    uint32_t  m_indexCount = 0;

    PolygonPushConstants            m_push;
    bool                            m_blend = false;
    std::shared_ptr<const Material> m_material;
};
