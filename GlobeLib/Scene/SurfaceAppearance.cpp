#include "SurfaceAppearance.hpp"

#include "Material.hpp"

namespace SurfaceAppearance
{
    AppearanceRequirements requirements(double height, const Material& material) noexcept
    {
        AppearanceRequirements req;
        req.vertexFormat = kVertexFormat;
        req.aboveGround  = height > 0.0;
        req.translucent  = material.translucent();
        return req;
    }
} // namespace SurfaceAppearance
