#include "HoleEliminator.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <utility>

#include "Polygon2D.hpp"
#include "PolygonErrors.hpp"
#include "TangentPlane.hpp"

namespace
{
    /// A ring vertex carried in both spaces so the splice stays in sync.
    struct RingVertex
    {
        glm::dvec3 position;
        glm::dvec2 projected;
    };

    using Ring = std::vector<RingVertex>;

    Ring makeRing(const BoundaryLoop& loop, const EllipsoidTangentPlane& plane, bool counterClockwise)
    {
        Ring ring;
        ring.reserve(loop.size());
        for (const glm::dvec3& p : loop)
            ring.push_back({p, plane.projectPoint(p)});

        std::vector<glm::dvec2> flat(ring.size());
        std::transform(ring.begin(), ring.end(), flat.begin(), [](const RingVertex& v) { return v.projected; });

        const double area = poly2d::signedArea(flat);
        if ((area > 0.0) != counterClockwise)
            std::reverse(ring.begin(), ring.end());

        return ring;
    }

    std::size_t rightMostVertex(const Ring& ring) noexcept
    {
        std::size_t best = 0;
        for (std::size_t i = 1; i < ring.size(); ++i)
        {
            const glm::dvec2& p = ring[i].projected;
            const glm::dvec2& b = ring[best].projected;
            if (p.x > b.x || (p.x == b.x && p.y > b.y))
                best = i;
        }
        return best;
    }

    bool crossesRing(const glm::dvec2& a, const glm::dvec2& b, const Ring& ring) noexcept
    {
        for (std::size_t i = 0, n = ring.size(); i < n; ++i)
        {
            if (poly2d::segmentsCross(a, b, ring[i].projected, ring[(i + 1) % n].projected))
                return true;
        }
        return false;
    }

    // m lies locally inside the CCW ring at vertex v (between edges prev->v and v->next).
    bool insideCorner(const glm::dvec2& prev, const glm::dvec2& v, const glm::dvec2& next, const glm::dvec2& m) noexcept
    {
        const bool leftOfIncoming = poly2d::orient(prev, v, m) > 0.0;
        const bool leftOfOutgoing = poly2d::orient(v, next, m) > 0.0;

        if (poly2d::orient(prev, v, next) >= 0.0)
            return leftOfIncoming && leftOfOutgoing;
        return leftOfIncoming || leftOfOutgoing;
    }

    std::size_t findBridgeVertex(const Ring&              merged,
                                 const glm::dvec2&        holePoint,
                                 const std::vector<Ring>& pending)
    {
        double      bestDist  = std::numeric_limits<double>::infinity();
        std::size_t bestIndex = std::numeric_limits<std::size_t>::max();

        const std::size_t n = merged.size();
        for (std::size_t i = 0; i < n; ++i)
        {
            const glm::dvec2& candidate = merged[i].projected;
            const glm::dvec2  d         = candidate - holePoint;
            const double      dist      = d.x * d.x + d.y * d.y;
            if (dist >= bestDist)
                continue;

            const glm::dvec2& prev = merged[(i + n - 1) % n].projected;
            const glm::dvec2& next = merged[(i + 1) % n].projected;
            if (!insideCorner(prev, candidate, next, holePoint))
                continue;

            if (crossesRing(holePoint, candidate, merged))
                continue;

            bool blocked = false;
            for (const Ring& hole : pending)
            {
                if (crossesRing(holePoint, candidate, hole))
                {
                    blocked = true;
                    break;
                }
            }
            if (blocked)
                continue;

            bestDist  = dist;
            bestIndex = i;
        }

        return bestIndex;
    }

    Ring splice(const Ring& merged, std::size_t bridgeIndex, const Ring& hole, std::size_t holeIndex)
    {
        Ring result;
        result.reserve(merged.size() + hole.size() + 2);

        result.insert(result.end(), merged.begin(), merged.begin() + static_cast<std::ptrdiff_t>(bridgeIndex) + 1);

        for (std::size_t i = 0; i < hole.size(); ++i)
            result.push_back(hole[(holeIndex + i) % hole.size()]);

        result.push_back(hole[holeIndex]);
        result.push_back(merged[bridgeIndex]);

        result.insert(result.end(), merged.begin() + static_cast<std::ptrdiff_t>(bridgeIndex) + 1, merged.end());
        return result;
    }
} // namespace

BridgeHoleEliminator::BridgeHoleEliminator(EllipsoidPtr ellipsoid) : m_ellipsoid{std::move(ellipsoid)}
{
    if (!m_ellipsoid)
        throw std::invalid_argument("BridgeHoleEliminator::BridgeHoleEliminator(): ellipsoid is null.");
}

BoundaryLoop BridgeHoleEliminator::eliminateHoles(const BoundaryLoop& outer, const std::vector<BoundaryLoop>& holes) const
{
    if (outer.size() < kMinLoopPoints)
        throw ConfigurationError("BridgeHoleEliminator::eliminateHoles(): at least three positions are required.");

    const EllipsoidTangentPlane plane = EllipsoidTangentPlane::fromPoints(*m_ellipsoid, outer);

    Ring merged = makeRing(outer, plane, true);

    std::vector<Ring> pending;
    pending.reserve(holes.size());
    for (const BoundaryLoop& hole : holes)
    {
        if (hole.size() < kMinLoopPoints)
            throw ConfigurationError("BridgeHoleEliminator::eliminateHoles(): at least three positions are required.");
        pending.push_back(makeRing(hole, plane, false));
    }

    // Right-most hole last in the vector so it can be popped first.
    std::sort(pending.begin(), pending.end(), [](const Ring& a, const Ring& b) {
        return a[rightMostVertex(a)].projected.x < b[rightMostVertex(b)].projected.x;
    });

    while (!pending.empty())
    {
        Ring hole = std::move(pending.back());
        pending.pop_back();

        const std::size_t holeIndex = rightMostVertex(hole);
        const glm::dvec2  holePoint = hole[holeIndex].projected;

        std::vector<Ring> blockers = pending;
        blockers.push_back(hole);

        const std::size_t bridgeIndex = findBridgeVertex(merged, holePoint, blockers);
        if (bridgeIndex >= merged.size())
            throw ConfigurationError("BridgeHoleEliminator::eliminateHoles(): hole has no visible vertex on the outer ring.");

        merged = splice(merged, bridgeIndex, hole, holeIndex);
    }

    BoundaryLoop result;
    result.reserve(merged.size());
    for (const RingVertex& v : merged)
        result.push_back(v.position);

    return result;
}
