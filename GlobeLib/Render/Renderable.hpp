#pragma once

#include <memory>

#include "PolygonGeometry.hpp"
#include "SurfaceAppearance.hpp"

class Material;
struct RenderFrameContext;

/// Abstract GPU representation of one built primitive.
///
/// Backends (VK / test fakes) own the device resources. The owner calls
/// destroy() explicitly before dropping the object; implementations must
/// tolerate repeated destroy() calls.
class Renderable
{
public:
    virtual ~Renderable() noexcept = default;

    /// Material used by subsequent draws. Assigned every frame by the owner.
    virtual void material(std::shared_ptr<const Material> material) = 0;

    /// Record draw commands for this frame.
    virtual void draw(const RenderFrameContext& fc) = 0;

    /// Release device resources now.
    virtual void destroy() noexcept = 0;
};

/// Factory for polygon geometry and renderables.
///
/// Both calls may throw; the caller keeps no partially built state.
class RenderBackend
{
public:
    virtual ~RenderBackend() noexcept = default;

    [[nodiscard]] virtual std::unique_ptr<PolygonGeometry> buildGeometry(const PolygonGeometryDesc& desc) = 0;

    [[nodiscard]] virtual std::unique_ptr<Renderable> buildRenderable(std::unique_ptr<PolygonGeometry> geometry,
                                                                      const AppearanceRequirements&    requirements) = 0;
};
