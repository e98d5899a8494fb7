#ifndef BOUNDARY_TYPES_HPP_INCLUDED
#define BOUNDARY_TYPES_HPP_INCLUDED

#include <cstddef>
#include <glm/vec3.hpp>
#include <variant>
#include <vector>

/**
 * @brief Ordered ring of 3-D surface points.
 *
 * Insertion order defines winding. The closing point is implied, never
 * duplicated. A usable loop has at least kMinLoopPoints points.
 */
using BoundaryLoop = std::vector<glm::dvec3>;

/// Hole-free loops produced by HierarchyFlattener.
using FlattenedPolygonSet = std::vector<BoundaryLoop>;

/// Smallest number of points a boundary ring may have.
inline constexpr std::size_t kMinLoopPoints = 3;

/**
 * @brief Outer ring plus the holes cut out of it.
 *
 * Each hole's `outer` is an inner boundary of this node. A hole's own
 * `holes` are islands lying inside that hole; they are filled again and
 * processed as independent polygons.
 */
struct HierarchyNode
{
    BoundaryLoop               outer;
    std::vector<HierarchyNode> holes;
};

// ----------------------------------------------------------
// Boundary state of a polygon primitive
// ----------------------------------------------------------

/// Nothing to draw.
struct UnsetBoundary
{
};

/// A single simple ring.
struct FlatBoundary
{
    BoundaryLoop positions;
};

/// Loops obtained by flattening a hierarchy.
struct FlattenedHierarchy
{
    FlattenedPolygonSet loops;
};

using BoundaryState = std::variant<UnsetBoundary, FlatBoundary, FlattenedHierarchy>;

/**
 * @brief True if the state holds nothing that can be tessellated.
 */
[[nodiscard]] inline bool isEmpty(const BoundaryState& state) noexcept
{
    if (const auto* flat = std::get_if<FlatBoundary>(&state))
        return flat->positions.empty();
    if (const auto* hierarchy = std::get_if<FlattenedHierarchy>(&state))
        return hierarchy->loops.empty();
    return true;
}

#endif // BOUNDARY_TYPES_HPP_INCLUDED
