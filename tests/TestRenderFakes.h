#pragma once

// Recording fakes for the SurfacePolygon collaborators, plus small
// geometry builders shared by the tests.

#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

#include "Ellipsoid.hpp"
#include "HoleEliminator.hpp"
#include "Material.hpp"
#include "PolygonGeometry.hpp"
#include "Renderable.hpp"
#include "VulkanContext.hpp"

namespace Test
{
    // -------------------------------------------------------------------------
    // Geometry builders
    // -------------------------------------------------------------------------

    // Point on the WGS84 surface (degrees).
    inline glm::dvec3 SurfacePoint(double lonDeg, double latDeg, double height = 0.0)
    {
        return Ellipsoid::wgs84()->cartographicToCartesian(
            Cartographic{glm::radians(lonDeg), glm::radians(latDeg), height});
    }

    // Counter-clockwise (seen from above) lon/lat square centered at (lon, lat).
    inline BoundaryLoop SurfaceSquare(double lonDeg, double latDeg, double halfSizeDeg)
    {
        return {
            SurfacePoint(lonDeg - halfSizeDeg, latDeg - halfSizeDeg),
            SurfacePoint(lonDeg + halfSizeDeg, latDeg - halfSizeDeg),
            SurfacePoint(lonDeg + halfSizeDeg, latDeg + halfSizeDeg),
            SurfacePoint(lonDeg - halfSizeDeg, latDeg + halfSizeDeg),
        };
    }

    // Distinct but otherwise arbitrary points; used where only identity matters.
    inline BoundaryLoop Ring(double seed, std::size_t count)
    {
        BoundaryLoop ring;
        for (std::size_t i = 0; i < count; ++i)
            ring.emplace_back(seed, static_cast<double>(i), 0.0);
        return ring;
    }

    // -------------------------------------------------------------------------
    // HoleEliminator fake
    // -------------------------------------------------------------------------

    struct EliminateCall
    {
        BoundaryLoop              outer;
        std::vector<BoundaryLoop> holes;
    };

    // Returns the outer ring followed by every hole ring, and records the call.
    class RecordingHoleEliminator final : public HoleEliminator
    {
    public:
        BoundaryLoop eliminateHoles(const BoundaryLoop& outer, const std::vector<BoundaryLoop>& holes) const override
        {
            calls.push_back({outer, holes});

            BoundaryLoop merged = outer;
            for (const BoundaryLoop& hole : holes)
                merged.insert(merged.end(), hole.begin(), hole.end());
            return merged;
        }

        mutable std::vector<EliminateCall> calls;
    };

    // -------------------------------------------------------------------------
    // RenderBackend / Renderable fakes
    // -------------------------------------------------------------------------

    struct RenderStats
    {
        int geometryBuilds      = 0;
        int renderableBuilds    = 0;
        int materialAssignments = 0;
        int draws               = 0;
        int destroys            = 0;

        std::vector<PolygonGeometryDesc>    geometryRequests;
        std::vector<AppearanceRequirements> appearanceRequests;

        std::shared_ptr<const Material> lastMaterial;
        VkCommandBuffer                 lastCmd = VK_NULL_HANDLE;
    };

    class FakeRenderable final : public Renderable
    {
    public:
        FakeRenderable(RenderStats& stats, int id) : m_stats{stats}, m_id{id}
        {
        }

        void material(std::shared_ptr<const Material> material) override
        {
            ++m_stats.materialAssignments;
            m_stats.lastMaterial = std::move(material);
        }

        void draw(const RenderFrameContext& fc) override
        {
            ++m_stats.draws;
            m_stats.lastCmd = fc.cmd;
        }

        void destroy() noexcept override
        {
            ++m_stats.destroys;
            ++destroyCount;
        }

        int id() const
        {
            return m_id;
        }

        int destroyCount = 0;

    private:
        RenderStats& m_stats;
        int          m_id;
    };

    class FakeRenderBackend final : public RenderBackend
    {
    public:
        std::unique_ptr<PolygonGeometry> buildGeometry(const PolygonGeometryDesc& desc) override
        {
            ++stats.geometryBuilds;
            stats.geometryRequests.push_back(desc);

            if (failGeometryBuilds > 0)
            {
                --failGeometryBuilds;
                throw std::runtime_error("FakeRenderBackend::buildGeometry(): out of memory");
            }

            auto geometry          = std::make_unique<PolygonGeometry>();
            geometry->vertexFormat = desc.vertexFormat;
            return geometry;
        }

        std::unique_ptr<Renderable> buildRenderable(std::unique_ptr<PolygonGeometry> geometry,
                                                    const AppearanceRequirements&    requirements) override
        {
            if (!geometry)
                throw std::invalid_argument("FakeRenderBackend::buildRenderable(): null geometry");

            ++stats.renderableBuilds;
            stats.appearanceRequests.push_back(requirements);
            return std::make_unique<FakeRenderable>(stats, stats.renderableBuilds);
        }

        RenderStats stats;
        int         failGeometryBuilds = 0;
    };

} // namespace Test
