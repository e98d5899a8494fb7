#ifndef POLYGON_2D_HPP_INCLUDED
#define POLYGON_2D_HPP_INCLUDED

#include <cstddef>
#include <glm/vec2.hpp>
#include <vector>

/**
 * @file Polygon2D.hpp
 * @brief Planar predicates shared by hole bridging and ear clipping.
 *
 * All functions work on tangent-plane coordinates in meters.
 */
namespace poly2d
{
    inline constexpr double kEpsilon = 1e-9;

    [[nodiscard]] inline double cross(const glm::dvec2& a, const glm::dvec2& b) noexcept
    {
        return a.x * b.y - a.y * b.x;
    }

    /// Twice the signed area of triangle (a, b, c); > 0 when counter-clockwise.
    [[nodiscard]] inline double orient(const glm::dvec2& a, const glm::dvec2& b, const glm::dvec2& c) noexcept
    {
        return cross(b - a, c - a);
    }

    /// Signed area (shoelace); > 0 when counter-clockwise.
    [[nodiscard]] double signedArea(const std::vector<glm::dvec2>& ring) noexcept;

    /// Point inside or on the boundary of triangle (a, b, c), either winding.
    [[nodiscard]] bool pointInTriangle(const glm::dvec2& p, const glm::dvec2& a, const glm::dvec2& b, const glm::dvec2& c) noexcept;

    /**
     * @brief Proper intersection test for segments (p0,p1) and (q0,q1).
     *
     * Touching at a shared endpoint does not count. Collinear overlap does.
     */
    [[nodiscard]] bool segmentsCross(const glm::dvec2& p0, const glm::dvec2& p1, const glm::dvec2& q0, const glm::dvec2& q1) noexcept;

    [[nodiscard]] inline bool samePoint(const glm::dvec2& a, const glm::dvec2& b) noexcept
    {
        const glm::dvec2 d = a - b;
        return d.x * d.x + d.y * d.y <= kEpsilon * kEpsilon;
    }

} // namespace poly2d

#endif // POLYGON_2D_HPP_INCLUDED
