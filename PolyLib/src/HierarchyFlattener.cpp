#include "HierarchyFlattener.hpp"

#include <queue>

#include "HoleEliminator.hpp"
#include "PolygonErrors.hpp"

HierarchyFlattener::HierarchyFlattener(const HoleEliminator& holeEliminator) noexcept : m_holeEliminator{holeEliminator}
{
}

FlattenedPolygonSet HierarchyFlattener::flatten(const HierarchyNode& root) const
{
    FlattenedPolygonSet polygons;

    // Nodes are borrowed from the caller's tree; nothing is copied until emitted.
    std::queue<const HierarchyNode*> queue;
    queue.push(&root);

    while (!queue.empty())
    {
        const HierarchyNode* outerNode = queue.front();
        queue.pop();

        const BoundaryLoop& outerRing = outerNode->outer;
        if (outerRing.size() < kMinLoopPoints)
            throw ConfigurationError("HierarchyFlattener::flatten(): at least three positions are required.");

        if (outerNode->holes.empty())
        {
            // Simple polygon, nothing to merge.
            polygons.push_back(outerRing);
            continue;
        }

        std::vector<BoundaryLoop> holes;
        holes.reserve(outerNode->holes.size());

        for (const HierarchyNode& hole : outerNode->holes)
        {
            // Holes are never dequeued themselves, so their rings are checked here.
            if (hole.outer.size() < kMinLoopPoints)
                throw ConfigurationError("HierarchyFlattener::flatten(): at least three positions are required for a hole.");

            holes.push_back(hole.outer);

            for (const HierarchyNode& island : hole.holes)
                queue.push(&island);
        }

        polygons.push_back(m_holeEliminator.eliminateHoles(outerRing, holes));
    }

    return polygons;
}
