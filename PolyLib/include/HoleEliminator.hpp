#ifndef HOLE_ELIMINATOR_HPP_INCLUDED
#define HOLE_ELIMINATOR_HPP_INCLUDED

#include <vector>

#include "BoundaryTypes.hpp"
#include "Ellipsoid.hpp"

/**
 * @brief Merges the holes of a polygon into its outer ring.
 *
 * Given one outer ring and N disjoint hole rings lying inside it, returns a
 * single simple ring covering the same area as outer minus holes. Inputs are
 * assumed non-self-intersecting; containment is not validated by callers.
 */
class HoleEliminator
{
public:
    virtual ~HoleEliminator() noexcept = default;

    [[nodiscard]] virtual BoundaryLoop eliminateHoles(const BoundaryLoop&              outer,
                                                      const std::vector<BoundaryLoop>& holes) const = 0;
};

/**
 * @brief HoleEliminator that cuts a bridge edge from each hole to the outer ring.
 *
 * Rings are projected onto the tangent plane of the outer ring. The outer
 * ring is oriented counter-clockwise and holes clockwise. Holes are merged
 * right-most first: the hole's right-most vertex is joined to the closest
 * merged-ring vertex that it can see, and the hole is spliced in with both
 * bridge endpoints duplicated.
 *
 * Throws ConfigurationError for rings with fewer than three points and for
 * holes that have no visible bridge vertex (typically a hole outside the
 * outer ring).
 */
class BridgeHoleEliminator final : public HoleEliminator
{
public:
    explicit BridgeHoleEliminator(EllipsoidPtr ellipsoid = Ellipsoid::wgs84());

    [[nodiscard]] BoundaryLoop eliminateHoles(const BoundaryLoop&              outer,
                                              const std::vector<BoundaryLoop>& holes) const override;

private:
    EllipsoidPtr m_ellipsoid;
};

#endif // HOLE_ELIMINATOR_HPP_INCLUDED
