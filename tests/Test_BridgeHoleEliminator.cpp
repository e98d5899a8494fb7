#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include "EarClipper.hpp"
#include "HoleEliminator.hpp"
#include "Polygon2D.hpp"
#include "PolygonErrors.hpp"
#include "TangentPlane.hpp"

#include "TestRenderFakes.h"

using Test::SurfaceSquare;

namespace
{
    bool containsPoint(const BoundaryLoop& loop, const glm::dvec3& p)
    {
        return std::find(loop.begin(), loop.end(), p) != loop.end();
    }

    double triangulatedArea(const std::vector<glm::dvec2>& ring)
    {
        std::vector<std::uint32_t> indices;
        EXPECT_TRUE(EarClipper::triangulate(ring, indices));

        double area = 0.0;
        for (std::size_t i = 0; i + 2 < indices.size(); i += 3)
            area += 0.5 * poly2d::orient(ring[indices[i]], ring[indices[i + 1]], ring[indices[i + 2]]);
        return area;
    }
} // namespace

TEST(BridgeHoleEliminator, NoHolesReturnsOuterRing)
{
    BridgeHoleEliminator eliminator;

    const BoundaryLoop outer  = SurfaceSquare(10.0, 20.0, 1.0);
    const BoundaryLoop result = eliminator.eliminateHoles(outer, {});

    ASSERT_EQ(result.size(), outer.size());
    for (const glm::dvec3& p : outer)
        EXPECT_TRUE(containsPoint(result, p));
}

TEST(BridgeHoleEliminator, SquareWithSquareHoleGetsTwoBridgePoints)
{
    BridgeHoleEliminator eliminator;

    const BoundaryLoop outer = SurfaceSquare(0.0, 0.0, 1.0);
    const BoundaryLoop hole  = SurfaceSquare(0.0, 0.0, 0.5);

    const BoundaryLoop result = eliminator.eliminateHoles(outer, {hole});

    ASSERT_EQ(result.size(), outer.size() + hole.size() + 2);
    for (const glm::dvec3& p : outer)
        EXPECT_TRUE(containsPoint(result, p));
    for (const glm::dvec3& p : hole)
        EXPECT_TRUE(containsPoint(result, p));
}

TEST(BridgeHoleEliminator, MergedRingCoversOuterMinusHoles)
{
    BridgeHoleEliminator eliminator;

    const BoundaryLoop outer = SurfaceSquare(0.0, 0.0, 2.0);
    const BoundaryLoop left  = SurfaceSquare(-1.0, 0.0, 0.4);
    const BoundaryLoop right = SurfaceSquare(1.0, 0.0, 0.4);

    const BoundaryLoop merged = eliminator.eliminateHoles(outer, {left, right});
    ASSERT_EQ(merged.size(), outer.size() + left.size() + right.size() + 4);

    const EllipsoidTangentPlane plane = EllipsoidTangentPlane::fromPoints(*Ellipsoid::wgs84(), outer);

    const double outerArea = std::abs(poly2d::signedArea(plane.projectPoints(outer)));
    const double holeArea  = std::abs(poly2d::signedArea(plane.projectPoints(left))) +
                            std::abs(poly2d::signedArea(plane.projectPoints(right)));

    const double mergedArea = triangulatedArea(plane.projectPoints(merged));
    EXPECT_NEAR(mergedArea, outerArea - holeArea, 1e-6 * outerArea);
}

TEST(BridgeHoleEliminator, ResultIsCounterClockwiseForClockwiseInput)
{
    BridgeHoleEliminator eliminator;

    BoundaryLoop outer = SurfaceSquare(30.0, 45.0, 1.0);
    std::reverse(outer.begin(), outer.end());

    const BoundaryLoop result = eliminator.eliminateHoles(outer, {SurfaceSquare(30.0, 45.0, 0.25)});

    const EllipsoidTangentPlane plane = EllipsoidTangentPlane::fromPoints(*Ellipsoid::wgs84(), outer);
    EXPECT_GT(poly2d::signedArea(plane.projectPoints(result)), 0.0);
}

TEST(BridgeHoleEliminator, RejectsShortRings)
{
    BridgeHoleEliminator eliminator;

    const BoundaryLoop outer = SurfaceSquare(0.0, 0.0, 1.0);
    const BoundaryLoop twoPoints{outer[0], outer[1]};

    EXPECT_THROW((void)eliminator.eliminateHoles(twoPoints, {}), ConfigurationError);
    EXPECT_THROW((void)eliminator.eliminateHoles(outer, {twoPoints}), ConfigurationError);
}

TEST(BridgeHoleEliminator, HoleOutsideOuterRingThrows)
{
    BridgeHoleEliminator eliminator;

    EXPECT_THROW((void)eliminator.eliminateHoles(SurfaceSquare(0.0, 0.0, 1.0), {SurfaceSquare(5.0, 0.0, 0.5)}),
                 ConfigurationError);
}

TEST(BridgeHoleEliminator, NullEllipsoidIsRejected)
{
    EXPECT_THROW(BridgeHoleEliminator{nullptr}, std::invalid_argument);
}
