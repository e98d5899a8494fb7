#include "Ellipsoid.hpp"

#include <algorithm>
#include <cmath>
#include <glm/glm.hpp>
#include <stdexcept>

#include "PolygonErrors.hpp"

namespace
{
    constexpr double kEpsilon12 = 1e-12;

    // Below this squared "ellipsoidal radius" the surface projection is unstable.
    constexpr double kCenterToleranceSquared = 0.1;
} // namespace

Ellipsoid::Ellipsoid(const glm::dvec3& radii) : m_radii{radii}
{
    if (!(radii.x > 0.0 && radii.y > 0.0 && radii.z > 0.0))
        throw ConfigurationError("Ellipsoid::Ellipsoid(): all radii must be greater than zero.");

    m_radiiSquared        = radii * radii;
    m_oneOverRadiiSquared = 1.0 / m_radiiSquared;
}

EllipsoidPtr Ellipsoid::wgs84()
{
    static const EllipsoidPtr s_wgs84 = std::make_shared<const Ellipsoid>(glm::dvec3{6378137.0, 6378137.0, 6356752.3142451793});
    return s_wgs84;
}

EllipsoidPtr Ellipsoid::unitSphere()
{
    static const EllipsoidPtr s_unit = std::make_shared<const Ellipsoid>(glm::dvec3{1.0, 1.0, 1.0});
    return s_unit;
}

const glm::dvec3& Ellipsoid::radii() const noexcept
{
    return m_radii;
}

const glm::dvec3& Ellipsoid::oneOverRadiiSquared() const noexcept
{
    return m_oneOverRadiiSquared;
}

double Ellipsoid::minimumRadius() const noexcept
{
    return std::min(m_radii.x, std::min(m_radii.y, m_radii.z));
}

double Ellipsoid::maximumRadius() const noexcept
{
    return std::max(m_radii.x, std::max(m_radii.y, m_radii.z));
}

glm::dvec3 Ellipsoid::geodeticSurfaceNormal(const glm::dvec3& position) const
{
    return glm::normalize(position * m_oneOverRadiiSquared);
}

glm::dvec3 Ellipsoid::geodeticSurfaceNormal(const Cartographic& cartographic) const
{
    const double cosLatitude = std::cos(cartographic.latitude);
    return glm::normalize(glm::dvec3{cosLatitude * std::cos(cartographic.longitude),
                                     cosLatitude * std::sin(cartographic.longitude),
                                     std::sin(cartographic.latitude)});
}

std::optional<glm::dvec3> Ellipsoid::scaleToGeodeticSurface(const glm::dvec3& position) const
{
    const double x2 = position.x * position.x * m_oneOverRadiiSquared.x;
    const double y2 = position.y * position.y * m_oneOverRadiiSquared.y;
    const double z2 = position.z * position.z * m_oneOverRadiiSquared.z;

    // Squared norm in "ellipsoid units"; 1.0 on the surface.
    const double squaredNorm = x2 + y2 + z2;
    const double ratio       = std::sqrt(1.0 / squaredNorm);

    const glm::dvec3 intersection = position * ratio;

    if (squaredNorm < kCenterToleranceSquared)
    {
        if (!std::isfinite(ratio))
            return std::nullopt;
        return intersection;
    }

    // Initial guess for the normal-line parameter from the geocentric intersection.
    const glm::dvec3 gradient = intersection * m_oneOverRadiiSquared * 2.0;

    double lambda     = (1.0 - ratio) * glm::length(position) / (0.5 * glm::length(gradient));
    double correction = 0.0;

    double     func = 0.0;
    glm::dvec3 multiplier{1.0};

    int iterations = 0;
    do
    {
        lambda -= correction;

        multiplier = 1.0 / (1.0 + lambda * m_oneOverRadiiSquared);

        const glm::dvec3 multiplier2 = multiplier * multiplier;
        const glm::dvec3 multiplier3 = multiplier2 * multiplier;

        func = x2 * multiplier2.x + y2 * multiplier2.y + z2 * multiplier2.z - 1.0;

        const double denominator = x2 * multiplier3.x * m_oneOverRadiiSquared.x +
                                   y2 * multiplier3.y * m_oneOverRadiiSquared.y +
                                   z2 * multiplier3.z * m_oneOverRadiiSquared.z;

        const double derivative = -2.0 * denominator;
        correction              = func / derivative;
    } while (std::abs(func) > kEpsilon12 && ++iterations < 64);

    return position * multiplier;
}

std::optional<glm::dvec3> Ellipsoid::scaleToGeocentricSurface(const glm::dvec3& position) const
{
    const glm::dvec3 scaled = position * position * m_oneOverRadiiSquared;
    const double     sum    = scaled.x + scaled.y + scaled.z;
    if (sum <= 0.0)
        return std::nullopt;

    return position * (1.0 / std::sqrt(sum));
}

glm::dvec3 Ellipsoid::cartographicToCartesian(const Cartographic& cartographic) const
{
    const glm::dvec3 n = geodeticSurfaceNormal(cartographic);
    glm::dvec3       k = m_radiiSquared * n;

    const double gamma = std::sqrt(glm::dot(n, k));
    k /= gamma;

    return k + n * cartographic.height;
}

std::optional<Cartographic> Ellipsoid::cartesianToCartographic(const glm::dvec3& position) const
{
    const std::optional<glm::dvec3> surface = scaleToGeodeticSurface(position);
    if (!surface)
        return std::nullopt;

    const glm::dvec3 n = geodeticSurfaceNormal(*surface);
    const glm::dvec3 h = position - *surface;

    Cartographic result;
    result.longitude = std::atan2(n.y, n.x);
    result.latitude  = std::asin(glm::clamp(n.z, -1.0, 1.0));
    result.height    = (glm::dot(h, position) < 0.0 ? -1.0 : 1.0) * glm::length(h);
    return result;
}

bool Ellipsoid::operator==(const Ellipsoid& other) const noexcept
{
    return m_radii == other.m_radii;
}
