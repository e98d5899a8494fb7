#include "TangentPlane.hpp"

#include <cmath>
#include <glm/glm.hpp>

#include "Ellipsoid.hpp"
#include "PolygonErrors.hpp"

EllipsoidTangentPlane::EllipsoidTangentPlane(const Ellipsoid& ellipsoid, const glm::dvec3& origin)
{
    const std::optional<glm::dvec3> surface = ellipsoid.scaleToGeodeticSurface(origin);
    if (!surface)
        throw ConfigurationError("EllipsoidTangentPlane::EllipsoidTangentPlane(): origin is at the ellipsoid center.");

    m_origin = *surface;
    m_normal = ellipsoid.geodeticSurfaceNormal(m_origin);

    // East = Z x normal. At the poles fall back to the X axis as "east".
    const glm::dvec3 east = glm::cross(glm::dvec3{0.0, 0.0, 1.0}, m_normal);
    if (glm::dot(east, east) < 1e-24)
        m_xAxis = glm::normalize(glm::cross(m_normal, glm::dvec3{0.0, 1.0, 0.0}));
    else
        m_xAxis = glm::normalize(east);

    m_yAxis = glm::normalize(glm::cross(m_normal, m_xAxis));
}

EllipsoidTangentPlane EllipsoidTangentPlane::fromPoints(const Ellipsoid& ellipsoid, const BoundaryLoop& points)
{
    if (points.empty())
        throw ConfigurationError("EllipsoidTangentPlane::fromPoints(): no points.");

    glm::dvec3 centroid{0.0};
    for (const glm::dvec3& p : points)
        centroid += p;
    centroid /= static_cast<double>(points.size());

    return EllipsoidTangentPlane(ellipsoid, centroid);
}

glm::dvec2 EllipsoidTangentPlane::projectPoint(const glm::dvec3& point) const noexcept
{
    // Central projection: intersect the ray center -> point with the plane.
    const double denom = glm::dot(m_normal, point);

    glm::dvec3 onPlane;
    if (denom > 1e-9)
    {
        const double t = glm::dot(m_normal, m_origin) / denom;
        onPlane        = point * t;
    }
    else
    {
        // Behind the plane (far side of the ellipsoid): orthogonal projection.
        onPlane = point - m_normal * glm::dot(m_normal, point - m_origin);
    }

    const glm::dvec3 d = onPlane - m_origin;
    return {glm::dot(d, m_xAxis), glm::dot(d, m_yAxis)};
}

std::vector<glm::dvec2> EllipsoidTangentPlane::projectPoints(const BoundaryLoop& points) const
{
    std::vector<glm::dvec2> result;
    result.reserve(points.size());
    for (const glm::dvec3& p : points)
        result.push_back(projectPoint(p));
    return result;
}
