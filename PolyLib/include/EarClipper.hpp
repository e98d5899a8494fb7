#ifndef EAR_CLIPPER_HPP_INCLUDED
#define EAR_CLIPPER_HPP_INCLUDED

#include <cstdint>
#include <glm/vec2.hpp>
#include <vector>

namespace EarClipper
{
    /**
     * @brief Triangulate a simple planar ring by ear clipping.
     *
     * Either winding is accepted; emitted triangles are always
     * counter-clockwise. Coincident vertices (the doubled endpoints of a
     * hole bridge) are tolerated, and degenerate zero-area corners are
     * dropped without emitting a triangle.
     *
     * @param ring       Ring vertices, closing point implied.
     * @param outIndices Receives 3 indices into `ring` per triangle (appended).
     * @return True if the whole ring was consumed, false if clipping got stuck
     *         (self-intersecting input); triangles found so far are kept.
     */
    bool triangulate(const std::vector<glm::dvec2>& ring, std::vector<std::uint32_t>& outIndices);

} // namespace EarClipper

#endif // EAR_CLIPPER_HPP_INCLUDED
