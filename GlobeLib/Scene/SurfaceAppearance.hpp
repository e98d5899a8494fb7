#pragma once

#include "VertexFormat.hpp"

class Material;

/**
 * @brief Draw-time state a renderable is built for.
 *
 * Changing any of these requires a new renderable; the material itself is
 * assigned separately every frame.
 */
struct AppearanceRequirements
{
    VertexFormat vertexFormat;
    bool         aboveGround = false; ///< Geometry floats above the surface (no depth clamp to terrain).
    bool         translucent = false; ///< Needs the blended pipeline.
};

/**
 * @brief Appearance for geometry lying on (or parallel to) the ellipsoid surface.
 *
 * Surface shading only needs positions and texture coordinates; normals are
 * reconstructed from the ellipsoid in the shader.
 */
namespace SurfaceAppearance
{
    inline constexpr VertexFormat kVertexFormat = VertexFormat::positionAndSt();

    /**
     * @param height   Surface offset of the primitive in meters.
     * @param material Current material.
     */
    [[nodiscard]] AppearanceRequirements requirements(double height, const Material& material) noexcept;

} // namespace SurfaceAppearance
