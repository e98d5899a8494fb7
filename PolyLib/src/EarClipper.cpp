#include "EarClipper.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

#include "Polygon2D.hpp"

namespace EarClipper
{
    namespace
    {
        bool containsOtherVertex(const std::vector<glm::dvec2>&    ring,
                                 const std::vector<std::uint32_t>& work,
                                 std::size_t                       i0,
                                 std::size_t                       i1,
                                 std::size_t                       i2)
        {
            const glm::dvec2& a = ring[work[i0]];
            const glm::dvec2& b = ring[work[i1]];
            const glm::dvec2& c = ring[work[i2]];

            for (std::size_t j = 0; j < work.size(); ++j)
            {
                if (j == i0 || j == i1 || j == i2)
                    continue;

                const glm::dvec2& p = ring[work[j]];

                // Bridge duplicates sit exactly on a corner; they do not block the ear.
                if (poly2d::samePoint(p, a) || poly2d::samePoint(p, b) || poly2d::samePoint(p, c))
                    continue;

                if (poly2d::pointInTriangle(p, a, b, c))
                    return true;
            }
            return false;
        }
    } // namespace

    bool triangulate(const std::vector<glm::dvec2>& ring, std::vector<std::uint32_t>& outIndices)
    {
        const std::size_t n = ring.size();
        if (n < 3)
            return false;

        std::vector<std::uint32_t> work;
        work.reserve(n);
        for (std::uint32_t i = 0; i < n; ++i)
            work.push_back(i);

        const bool ccw = poly2d::signedArea(ring) > 0.0;

        // Scale-aware threshold for "this corner has no area".
        double extent = 0.0;
        for (const glm::dvec2& p : ring)
            extent = std::max(extent, std::max(std::abs(p.x), std::abs(p.y)));
        const double areaEps = poly2d::kEpsilon * std::max(1.0, extent * extent);

        auto emit = [&](std::uint32_t a, std::uint32_t b, std::uint32_t c) {
            outIndices.push_back(a);
            if (ccw)
            {
                outIndices.push_back(b);
                outIndices.push_back(c);
            }
            else
            {
                outIndices.push_back(c);
                outIndices.push_back(b);
            }
        };

        // O(n^2) clipping; rings here are small (one polygon boundary each).
        while (work.size() > 3)
        {
            bool earFound = false;

            for (std::size_t i = 0; i < work.size(); ++i)
            {
                const std::size_t i0 = (i + work.size() - 1) % work.size();
                const std::size_t i2 = (i + 1) % work.size();

                const double z = poly2d::orient(ring[work[i0]], ring[work[i]], ring[work[i2]]);
                const bool   convex = ccw ? (z > areaEps) : (z < -areaEps);
                if (!convex)
                    continue;

                if (containsOtherVertex(ring, work, i0, i, i2))
                    continue;

                emit(work[i0], work[i], work[i2]);
                work.erase(work.begin() + static_cast<std::ptrdiff_t>(i));
                earFound = true;
                break;
            }

            if (earFound)
                continue;

            // No ear: drop one zero-area corner (spikes left by bridges), or give up.
            bool dropped = false;
            for (std::size_t i = 0; i < work.size(); ++i)
            {
                const std::size_t i0 = (i + work.size() - 1) % work.size();
                const std::size_t i2 = (i + 1) % work.size();

                const double z = poly2d::orient(ring[work[i0]], ring[work[i]], ring[work[i2]]);
                if (std::abs(z) <= areaEps)
                {
                    work.erase(work.begin() + static_cast<std::ptrdiff_t>(i));
                    dropped = true;
                    break;
                }
            }

            if (!dropped)
                return false;
        }

        const double z = poly2d::orient(ring[work[0]], ring[work[1]], ring[work[2]]);
        if (std::abs(z) > areaEps)
            emit(work[0], work[1], work[2]);

        return true;
    }

} // namespace EarClipper
