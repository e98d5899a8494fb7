#ifndef POLYGON_TESSELLATOR_HPP_INCLUDED
#define POLYGON_TESSELLATOR_HPP_INCLUDED

#include "PolygonGeometry.hpp"

/**
 * @brief CPU tessellation of polygon boundaries onto an ellipsoid surface.
 *
 * For every loop of the description:
 *  1. project onto the loop's tangent plane and ear-clip,
 *  2. bisect triangle edges until each subtends at most `granularity`
 *     radians at the ellipsoid center (midpoints are shared, so the result
 *     has no T-junctions),
 *  3. move every vertex to the surface and lift it by `height` along the
 *     geodetic normal,
 *  4. fill the attributes requested by the vertex format.
 *
 * Texture coordinates come from the tangent-plane coordinates rotated by
 * `stRotation` and normalized to the loop's bounding rectangle.
 */
class PolygonTessellator
{
public:
    /**
     * @throws ConfigurationError for a missing ellipsoid, a non-positive
     *         granularity, a ring with fewer than three points, or a point at
     *         the ellipsoid center.
     */
    [[nodiscard]] PolygonGeometry tessellate(const PolygonGeometryDesc& desc) const;
};

#endif // POLYGON_TESSELLATOR_HPP_INCLUDED
