#include <gtest/gtest.h>
#include <cmath>

#include <glm/glm.hpp>

#include "Ellipsoid.hpp"
#include "PolygonErrors.hpp"
#include "TangentPlane.hpp"

TEST(Ellipsoid, SharedInstancesAreStable)
{
    EXPECT_EQ(Ellipsoid::wgs84(), Ellipsoid::wgs84());
    EXPECT_EQ(Ellipsoid::unitSphere(), Ellipsoid::unitSphere());
    EXPECT_NE(Ellipsoid::wgs84(), Ellipsoid::unitSphere());

    EXPECT_DOUBLE_EQ(Ellipsoid::wgs84()->maximumRadius(), 6378137.0);
    EXPECT_NEAR(Ellipsoid::wgs84()->minimumRadius(), 6356752.3142, 1e-3);
}

TEST(Ellipsoid, RejectsNonPositiveRadii)
{
    EXPECT_THROW(Ellipsoid(glm::dvec3{1.0, 0.0, 1.0}), ConfigurationError);
    EXPECT_THROW(Ellipsoid(glm::dvec3{-1.0, 1.0, 1.0}), ConfigurationError);
}

TEST(Ellipsoid, ValueEqualityComparesRadii)
{
    const Ellipsoid a(glm::dvec3{2.0, 2.0, 1.0});
    const Ellipsoid b(glm::dvec3{2.0, 2.0, 1.0});
    const Ellipsoid c(glm::dvec3{2.0, 2.0, 2.0});

    EXPECT_TRUE(a == b);
    EXPECT_FALSE(a == c);
}

TEST(Ellipsoid, CartographicRoundTrip)
{
    const EllipsoidPtr wgs84 = Ellipsoid::wgs84();

    const Cartographic input{glm::radians(-75.5), glm::radians(40.25), 1234.5};
    const glm::dvec3   position = wgs84->cartographicToCartesian(input);

    const std::optional<Cartographic> output = wgs84->cartesianToCartographic(position);
    ASSERT_TRUE(output.has_value());
    EXPECT_NEAR(output->longitude, input.longitude, 1e-12);
    EXPECT_NEAR(output->latitude, input.latitude, 1e-12);
    EXPECT_NEAR(output->height, input.height, 1e-6);
}

TEST(Ellipsoid, ScaleToGeodeticSurfaceLandsOnSurface)
{
    const EllipsoidPtr wgs84 = Ellipsoid::wgs84();
    const glm::dvec3   above{7000000.0, 1000000.0, 3000000.0};

    const std::optional<glm::dvec3> surface = wgs84->scaleToGeodeticSurface(above);
    ASSERT_TRUE(surface.has_value());

    const glm::dvec3 s = *surface * *surface * wgs84->oneOverRadiiSquared();
    EXPECT_NEAR(s.x + s.y + s.z, 1.0, 1e-12);

    // The offset is along the surface normal.
    const glm::dvec3 offset = glm::normalize(above - *surface);
    EXPECT_NEAR(glm::dot(offset, wgs84->geodeticSurfaceNormal(*surface)), 1.0, 1e-9);
}

TEST(Ellipsoid, CenterHasNoSurfaceProjection)
{
    const EllipsoidPtr wgs84 = Ellipsoid::wgs84();

    EXPECT_FALSE(wgs84->scaleToGeodeticSurface(glm::dvec3{0.0}).has_value());
    EXPECT_FALSE(wgs84->scaleToGeocentricSurface(glm::dvec3{0.0}).has_value());
    EXPECT_FALSE(wgs84->cartesianToCartographic(glm::dvec3{0.0}).has_value());
}

TEST(Ellipsoid, GeodeticNormalAtEquatorAndPole)
{
    const EllipsoidPtr wgs84 = Ellipsoid::wgs84();

    const glm::dvec3 equator = wgs84->geodeticSurfaceNormal(glm::dvec3{6378137.0, 0.0, 0.0});
    EXPECT_NEAR(equator.x, 1.0, 1e-15);

    const glm::dvec3 pole = wgs84->geodeticSurfaceNormal(Cartographic{0.0, glm::radians(90.0), 0.0});
    EXPECT_NEAR(pole.z, 1.0, 1e-15);
}

TEST(EllipsoidTangentPlane, AxesPointEastAndNorth)
{
    const EllipsoidPtr wgs84 = Ellipsoid::wgs84();

    const EllipsoidTangentPlane plane(*wgs84, wgs84->cartographicToCartesian(Cartographic{0.0, 0.0, 0.0}));

    EXPECT_NEAR(plane.normal().x, 1.0, 1e-12);
    EXPECT_NEAR(plane.xAxis().y, 1.0, 1e-12); // east
    EXPECT_NEAR(plane.yAxis().z, 1.0, 1e-12); // north

    const glm::dvec2 east = plane.projectPoint(wgs84->cartographicToCartesian(Cartographic{glm::radians(0.1), 0.0, 0.0}));
    EXPECT_GT(east.x, 0.0);
    EXPECT_NEAR(east.y, 0.0, 1e-6);

    const glm::dvec2 origin = plane.projectPoint(plane.origin());
    EXPECT_NEAR(origin.x, 0.0, 1e-9);
    EXPECT_NEAR(origin.y, 0.0, 1e-9);
}

TEST(EllipsoidTangentPlane, OriginAtCenterThrows)
{
    EXPECT_THROW(EllipsoidTangentPlane(*Ellipsoid::wgs84(), glm::dvec3{0.0}), ConfigurationError);
    EXPECT_THROW((void)EllipsoidTangentPlane::fromPoints(*Ellipsoid::wgs84(), {}), ConfigurationError);
}
