#include "Polygon2D.hpp"

#include <algorithm>
#include <cmath>

namespace poly2d
{
    namespace
    {
        int sign(double v) noexcept
        {
            if (v > kEpsilon)
                return 1;
            if (v < -kEpsilon)
                return -1;
            return 0;
        }

        // q lies on segment (p0, p1), assuming the three points are collinear.
        bool onSegment(const glm::dvec2& p0, const glm::dvec2& p1, const glm::dvec2& q) noexcept
        {
            return q.x <= std::max(p0.x, p1.x) + kEpsilon && q.x >= std::min(p0.x, p1.x) - kEpsilon &&
                   q.y <= std::max(p0.y, p1.y) + kEpsilon && q.y >= std::min(p0.y, p1.y) - kEpsilon;
        }
    } // namespace

    double signedArea(const std::vector<glm::dvec2>& ring) noexcept
    {
        if (ring.size() < 3)
            return 0.0;

        double area = 0.0;
        for (std::size_t i = 0, n = ring.size(); i < n; ++i)
            area += cross(ring[i], ring[(i + 1) % n]);

        return 0.5 * area;
    }

    bool pointInTriangle(const glm::dvec2& p, const glm::dvec2& a, const glm::dvec2& b, const glm::dvec2& c) noexcept
    {
        const double c1 = orient(a, b, p);
        const double c2 = orient(b, c, p);
        const double c3 = orient(c, a, p);

        const bool hasNeg = (c1 < -kEpsilon) || (c2 < -kEpsilon) || (c3 < -kEpsilon);
        const bool hasPos = (c1 > kEpsilon) || (c2 > kEpsilon) || (c3 > kEpsilon);
        return !(hasNeg && hasPos);
    }

    bool segmentsCross(const glm::dvec2& p0, const glm::dvec2& p1, const glm::dvec2& q0, const glm::dvec2& q1) noexcept
    {
        if (samePoint(p0, q0) || samePoint(p0, q1) || samePoint(p1, q0) || samePoint(p1, q1))
            return false;

        const int o1 = sign(orient(p0, p1, q0));
        const int o2 = sign(orient(p0, p1, q1));
        const int o3 = sign(orient(q0, q1, p0));
        const int o4 = sign(orient(q0, q1, p1));

        if (o1 != o2 && o3 != o4)
            return true;

        if (o1 == 0 && onSegment(p0, p1, q0))
            return true;
        if (o2 == 0 && onSegment(p0, p1, q1))
            return true;
        if (o3 == 0 && onSegment(q0, q1, p0))
            return true;
        if (o4 == 0 && onSegment(q0, q1, p1))
            return true;

        return false;
    }

} // namespace poly2d
