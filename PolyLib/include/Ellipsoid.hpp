#ifndef ELLIPSOID_HPP_INCLUDED
#define ELLIPSOID_HPP_INCLUDED

#include <glm/vec3.hpp>
#include <memory>
#include <optional>

class Ellipsoid;
using EllipsoidPtr = std::shared_ptr<const Ellipsoid>;

/**
 * @brief Geodetic position: longitude/latitude in radians, height in meters.
 */
struct Cartographic
{
    double longitude = 0.0;
    double latitude  = 0.0;
    double height    = 0.0;
};

/**
 * @brief Axis-aligned reference ellipsoid centered at the origin.
 *
 * x^2/a^2 + y^2/b^2 + z^2/c^2 = 1 with radii (a, b, c) in meters.
 *
 * Polygon primitives hold ellipsoids through EllipsoidPtr and compare them
 * by pointer identity, so the shared instances returned by wgs84() and
 * unitSphere() should be reused rather than copied.
 */
class Ellipsoid
{
public:
    /**
     * @brief Construct from radii.
     * @param radii Semi-axes in meters, all components > 0.
     */
    explicit Ellipsoid(const glm::dvec3& radii);

    /** @brief Shared WGS84 instance. */
    [[nodiscard]] static EllipsoidPtr wgs84();

    /** @brief Shared unit sphere instance. */
    [[nodiscard]] static EllipsoidPtr unitSphere();

    [[nodiscard]] const glm::dvec3& radii() const noexcept;
    [[nodiscard]] const glm::dvec3& oneOverRadiiSquared() const noexcept;

    [[nodiscard]] double minimumRadius() const noexcept;
    [[nodiscard]] double maximumRadius() const noexcept;

    /**
     * @brief Outward surface normal at (or above) a surface position.
     * @param position Cartesian position, not the origin.
     */
    [[nodiscard]] glm::dvec3 geodeticSurfaceNormal(const glm::dvec3& position) const;

    /**
     * @brief Surface normal for a geodetic longitude/latitude.
     */
    [[nodiscard]] glm::dvec3 geodeticSurfaceNormal(const Cartographic& cartographic) const;

    /**
     * @brief Project a position onto the surface along the geodetic normal.
     *
     * Newton iteration on the surface constraint. Positions too close to the
     * center have no well-defined projection.
     *
     * @return Surface position, or std::nullopt near the center.
     */
    [[nodiscard]] std::optional<glm::dvec3> scaleToGeodeticSurface(const glm::dvec3& position) const;

    /**
     * @brief Project a position onto the surface along the geocentric direction.
     * @return Surface position, or std::nullopt for the origin.
     */
    [[nodiscard]] std::optional<glm::dvec3> scaleToGeocentricSurface(const glm::dvec3& position) const;

    [[nodiscard]] glm::dvec3 cartographicToCartesian(const Cartographic& cartographic) const;

    /**
     * @return Geodetic coordinates, or std::nullopt near the center.
     */
    [[nodiscard]] std::optional<Cartographic> cartesianToCartographic(const glm::dvec3& position) const;

    /**
     * @brief Value equality of the radii.
     *
     * Not used for dirty tracking, which compares by identity.
     */
    [[nodiscard]] bool operator==(const Ellipsoid& other) const noexcept;

private:
    glm::dvec3 m_radii;
    glm::dvec3 m_radiiSquared;
    glm::dvec3 m_oneOverRadiiSquared;
};

#endif // ELLIPSOID_HPP_INCLUDED
