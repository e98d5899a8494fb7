#include "PolygonTessellator.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <glm/glm.hpp>
#include <iostream>
#include <limits>
#include <map>
#include <utility>

#include "EarClipper.hpp"
#include "PolygonErrors.hpp"
#include "TangentPlane.hpp"

namespace
{
    using Triangle = std::array<std::uint32_t, 3>;

    double edgeAngle(const glm::dvec3& a, const glm::dvec3& b) noexcept
    {
        const double cosAngle = glm::dot(glm::normalize(a), glm::normalize(b));
        return std::acos(glm::clamp(cosAngle, -1.0, 1.0));
    }

    /// Splits triangles along their longest edge until every edge is short enough.
    void subdivide(std::vector<glm::dvec3>& positions, std::vector<Triangle>& triangles, double granularity)
    {
        std::map<std::pair<std::uint32_t, std::uint32_t>, std::uint32_t> midpoints;

        auto midpoint = [&](std::uint32_t a, std::uint32_t b) -> std::uint32_t {
            const auto key = std::minmax(a, b);
            auto       it  = midpoints.find({key.first, key.second});
            if (it != midpoints.end())
                return it->second;

            const auto index = static_cast<std::uint32_t>(positions.size());
            positions.push_back((positions[a] + positions[b]) * 0.5);
            midpoints.emplace(std::make_pair(key.first, key.second), index);
            return index;
        };

        std::vector<Triangle> work = std::move(triangles);
        triangles.clear();

        while (!work.empty())
        {
            const Triangle tri = work.back();
            work.pop_back();

            int    longest  = -1;
            double maxAngle = granularity;
            for (int e = 0; e < 3; ++e)
            {
                const double angle = edgeAngle(positions[tri[e]], positions[tri[(e + 1) % 3]]);
                if (angle > maxAngle)
                {
                    maxAngle = angle;
                    longest  = e;
                }
            }

            if (longest < 0)
            {
                triangles.push_back(tri);
                continue;
            }

            const std::uint32_t a = tri[longest];
            const std::uint32_t b = tri[(longest + 1) % 3];
            const std::uint32_t c = tri[(longest + 2) % 3];
            const std::uint32_t m = midpoint(a, b);

            work.push_back({a, m, c});
            work.push_back({m, b, c});
        }
    }

    glm::dvec3 eastOf(const glm::dvec3& normal) noexcept
    {
        const glm::dvec3 east = glm::cross(glm::dvec3{0.0, 0.0, 1.0}, normal);
        if (glm::dot(east, east) < 1e-24)
            return glm::normalize(glm::cross(normal, glm::dvec3{0.0, 1.0, 0.0}));
        return glm::normalize(east);
    }

    void appendLoop(const BoundaryLoop& loop, const PolygonGeometryDesc& desc, PolygonGeometry& out)
    {
        if (loop.size() < kMinLoopPoints)
            throw ConfigurationError("PolygonTessellator::tessellate(): at least three positions are required.");

        const Ellipsoid&            ellipsoid = *desc.ellipsoid;
        const EllipsoidTangentPlane plane     = EllipsoidTangentPlane::fromPoints(ellipsoid, loop);

        std::vector<std::uint32_t> clipped;
        if (!EarClipper::triangulate(plane.projectPoints(loop), clipped))
        {
            std::cerr << "PolygonTessellator::tessellate: loop with " << loop.size()
                      << " points could not be fully triangulated (self-intersecting?).\n";
        }

        std::vector<glm::dvec3> positions = loop;
        std::vector<Triangle>   triangles;
        triangles.reserve(clipped.size() / 3);
        for (std::size_t i = 0; i + 2 < clipped.size(); i += 3)
            triangles.push_back({clipped[i], clipped[i + 1], clipped[i + 2]});

        subdivide(positions, triangles, desc.granularity);

        const VertexFormat& format = desc.vertexFormat;
        const double        angle  = desc.stRotation.value_or(0.0);
        const double        cosA   = std::cos(angle);
        const double        sinA   = std::sin(angle);

        const auto base = static_cast<std::uint32_t>(out.positions.size());

        std::vector<glm::dvec2> planar;
        planar.reserve(positions.size());

        for (const glm::dvec3& p : positions)
        {
            const std::optional<glm::dvec3> surface = ellipsoid.scaleToGeodeticSurface(p);
            if (!surface)
                throw ConfigurationError("PolygonTessellator::tessellate(): position is at the ellipsoid center.");

            const glm::dvec3 normal = ellipsoid.geodeticSurfaceNormal(*surface);
            out.positions.push_back(*surface + normal * desc.height);

            if (format.normal)
                out.normals.emplace_back(normal);

            if (format.tangent || format.binormal)
            {
                const glm::dvec3 east    = eastOf(normal);
                const glm::dvec3 north   = glm::cross(normal, east);
                const glm::dvec3 tangent = east * cosA + north * sinA;

                if (format.tangent)
                    out.tangents.emplace_back(tangent);
                if (format.binormal)
                    out.binormals.emplace_back(glm::cross(normal, tangent));
            }

            if (format.st)
            {
                const glm::dvec2 q = plane.projectPoint(*surface);
                planar.push_back({q.x * cosA - q.y * sinA, q.x * sinA + q.y * cosA});
            }
        }

        if (format.st)
        {
            glm::dvec2 minSt{std::numeric_limits<double>::max()};
            glm::dvec2 maxSt{std::numeric_limits<double>::lowest()};
            for (const glm::dvec2& q : planar)
            {
                minSt = glm::min(minSt, q);
                maxSt = glm::max(maxSt, q);
            }

            const glm::dvec2 size = maxSt - minSt;
            for (const glm::dvec2& q : planar)
            {
                const double s = size.x > 0.0 ? (q.x - minSt.x) / size.x : 0.0;
                const double t = size.y > 0.0 ? (q.y - minSt.y) / size.y : 0.0;
                out.st.emplace_back(static_cast<float>(s), static_cast<float>(t));
            }
        }

        for (const Triangle& tri : triangles)
        {
            out.indices.push_back(base + tri[0]);
            out.indices.push_back(base + tri[1]);
            out.indices.push_back(base + tri[2]);
        }
    }

    void computeBoundingSphere(PolygonGeometry& geometry) noexcept
    {
        if (geometry.positions.empty())
            return;

        glm::dvec3 center{0.0};
        for (const glm::dvec3& p : geometry.positions)
            center += p;
        center /= static_cast<double>(geometry.positions.size());

        double radius = 0.0;
        for (const glm::dvec3& p : geometry.positions)
            radius = std::max(radius, glm::distance(center, p));

        geometry.center = center;
        geometry.radius = radius;
    }
} // namespace

PolygonGeometry PolygonTessellator::tessellate(const PolygonGeometryDesc& desc) const
{
    if (!desc.ellipsoid)
        throw ConfigurationError("PolygonTessellator::tessellate(): ellipsoid is null.");

    if (!(desc.granularity > 0.0) || !std::isfinite(desc.granularity))
        throw ConfigurationError("PolygonTessellator::tessellate(): granularity must be greater than zero.");

    PolygonGeometry geometry;
    geometry.vertexFormat = desc.vertexFormat;

    if (const auto* flat = std::get_if<FlatBoundary>(&desc.boundary))
    {
        appendLoop(flat->positions, desc, geometry);
    }
    else if (const auto* hierarchy = std::get_if<FlattenedHierarchy>(&desc.boundary))
    {
        for (const BoundaryLoop& loop : hierarchy->loops)
            appendLoop(loop, desc, geometry);
    }

    computeBoundingSphere(geometry);
    return geometry;
}
