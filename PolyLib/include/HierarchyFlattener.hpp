#ifndef HIERARCHY_FLATTENER_HPP_INCLUDED
#define HIERARCHY_FLATTENER_HPP_INCLUDED

#include "BoundaryTypes.hpp"

class HoleEliminator;

/**
 * @brief Reduces a nested outer/hole/island hierarchy to hole-free loops.
 *
 * Traversal is breadth-first over an explicit FIFO work list seeded with
 * the root, so nesting depth is bounded only by memory. For each node:
 *  - without holes, its outer ring is emitted unchanged;
 *  - with holes, the outer ring and the outer rings of its direct holes are
 *    merged by one HoleEliminator call, and every island inside those holes
 *    is queued as a new top-level polygon.
 *
 * Output order is the dequeue order. The flattener holds no mutable state
 * and can be shared.
 */
class HierarchyFlattener
{
public:
    /**
     * @param holeEliminator Merging algorithm; must outlive the flattener.
     */
    explicit HierarchyFlattener(const HoleEliminator& holeEliminator) noexcept;

    /**
     * @brief Flatten a hierarchy.
     * @throws ConfigurationError if any ring, at any depth, has fewer than
     *         three points. A node's ring and the rings of its direct holes
     *         are checked when the node is dequeued.
     */
    [[nodiscard]] FlattenedPolygonSet flatten(const HierarchyNode& root) const;

private:
    const HoleEliminator& m_holeEliminator;
};

#endif // HIERARCHY_FLATTENER_HPP_INCLUDED
