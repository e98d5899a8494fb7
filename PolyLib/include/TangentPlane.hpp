#ifndef TANGENT_PLANE_HPP_INCLUDED
#define TANGENT_PLANE_HPP_INCLUDED

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <vector>

#include "BoundaryTypes.hpp"

class Ellipsoid;

/**
 * @brief Local east/north plane tangent to an ellipsoid.
 *
 * The plane touches the ellipsoid at the geodetic projection of the centroid
 * of a point set. Points are mapped to 2-D plane coordinates by a central
 * projection through the ellipsoid center, which keeps straight geodesic-ish
 * edges straight and preserves winding for points on the near hemisphere.
 */
class EllipsoidTangentPlane
{
public:
    /**
     * @brief Plane tangent at the surface point below `origin`.
     * @throws ConfigurationError if origin is too close to the ellipsoid center.
     */
    EllipsoidTangentPlane(const Ellipsoid& ellipsoid, const glm::dvec3& origin);

    /**
     * @brief Plane tangent below the centroid of the given points.
     * @throws ConfigurationError if points is empty or the centroid is degenerate.
     */
    [[nodiscard]] static EllipsoidTangentPlane fromPoints(const Ellipsoid& ellipsoid, const BoundaryLoop& points);

    [[nodiscard]] const glm::dvec3& origin() const noexcept
    {
        return m_origin;
    }

    [[nodiscard]] const glm::dvec3& normal() const noexcept
    {
        return m_normal;
    }

    [[nodiscard]] const glm::dvec3& xAxis() const noexcept
    {
        return m_xAxis;
    }

    [[nodiscard]] const glm::dvec3& yAxis() const noexcept
    {
        return m_yAxis;
    }

    [[nodiscard]] glm::dvec2 projectPoint(const glm::dvec3& point) const noexcept;

    [[nodiscard]] std::vector<glm::dvec2> projectPoints(const BoundaryLoop& points) const;

private:
    glm::dvec3 m_origin;
    glm::dvec3 m_normal;
    glm::dvec3 m_xAxis;
    glm::dvec3 m_yAxis;
};

#endif // TANGENT_PLANE_HPP_INCLUDED
