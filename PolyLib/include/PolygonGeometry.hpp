#ifndef POLYGON_GEOMETRY_HPP_INCLUDED
#define POLYGON_GEOMETRY_HPP_INCLUDED

#include <cstdint>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <optional>
#include <variant>
#include <vector>

#include "BoundaryTypes.hpp"
#include "Ellipsoid.hpp"
#include "VertexFormat.hpp"

/**
 * @brief Everything needed to tessellate one polygon primitive.
 *
 * `boundary` is either a FlatBoundary or a FlattenedHierarchy; UnsetBoundary
 * is never passed to a geometry builder.
 */
struct PolygonGeometryDesc
{
    BoundaryState         boundary;
    double                height      = 0.0;
    std::optional<double> stRotation;          ///< Texture rotation in radians.
    EllipsoidPtr          ellipsoid;
    double                granularity = 0.0;   ///< Max edge angle in radians.
    VertexFormat          vertexFormat;
};

/**
 * @brief Indexed triangle mesh on (or above) the ellipsoid surface.
 *
 * Attribute arrays are either empty (not requested) or parallel to
 * `positions`. `indices` holds 3 entries per triangle, counter-clockwise
 * when seen from above the surface.
 */
struct PolygonGeometry
{
    std::vector<glm::dvec3>    positions;
    std::vector<glm::vec3>     normals;
    std::vector<glm::vec2>     st;
    std::vector<glm::vec3>     tangents;
    std::vector<glm::vec3>     binormals;
    std::vector<std::uint32_t> indices;

    /// Bounding sphere, used as the relative-to-center origin on upload.
    glm::dvec3 center{0.0};
    double     radius = 0.0;

    VertexFormat vertexFormat;

    [[nodiscard]] std::size_t vertexCount() const noexcept
    {
        return positions.size();
    }

    [[nodiscard]] std::size_t triangleCount() const noexcept
    {
        return indices.size() / 3;
    }
};

#endif // POLYGON_GEOMETRY_HPP_INCLUDED
