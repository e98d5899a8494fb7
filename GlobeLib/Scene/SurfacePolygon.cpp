#include "SurfacePolygon.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "HoleEliminator.hpp"
#include "PolygonErrors.hpp"
#include "PolygonGeometry.hpp"
#include "Renderable.hpp"
#include "SurfaceAppearance.hpp"

namespace
{
    const HoleEliminator& requireEliminator(const HoleEliminator* holeEliminator)
    {
        if (!holeEliminator)
            throw std::invalid_argument("SurfacePolygon::SurfacePolygon(): null HoleEliminator");
        return *holeEliminator;
    }

    const BoundaryLoop        kNoPositions;
    const FlattenedPolygonSet kNoLoops;
} // namespace

SurfacePolygon::SurfacePolygon(const HoleEliminator* holeEliminator, RenderBackend* backend, SurfacePolygonOptions options) :
    m_flattener{requireEliminator(holeEliminator)},
    m_backend{backend},
    m_ellipsoid{std::move(options.ellipsoid)},
    m_granularity{options.granularity},
    m_height{options.height},
    m_textureRotationAngle{options.textureRotationAngle},
    m_visible{options.visible},
    m_material{std::move(options.material)},
    m_boundaryCounter{std::make_shared<ChangeCounter>()},
    m_rebuildMonitor{m_boundaryCounter}
{
    if (!m_backend)
        throw std::invalid_argument("SurfacePolygon::SurfacePolygon(): null RenderBackend");

    if (options.hierarchy)
        setHierarchy(*options.hierarchy);
    else if (options.positions)
        setFlatBoundary(std::move(*options.positions));
}

SurfacePolygon::~SurfacePolygon() noexcept
{
    releaseRenderable();
}

// -----------------------------
// Render configuration
// -----------------------------

const EllipsoidPtr& SurfacePolygon::ellipsoid() const
{
    ensureAlive("ellipsoid");
    return m_ellipsoid;
}

void SurfacePolygon::ellipsoid(EllipsoidPtr ellipsoid)
{
    ensureAlive("ellipsoid");
    m_ellipsoid = std::move(ellipsoid);
}

double SurfacePolygon::granularity() const
{
    ensureAlive("granularity");
    return m_granularity;
}

void SurfacePolygon::granularity(double radians)
{
    ensureAlive("granularity");
    m_granularity = radians;
}

double SurfacePolygon::height() const
{
    ensureAlive("height");
    return m_height;
}

void SurfacePolygon::height(double meters)
{
    ensureAlive("height");
    m_height = meters;
}

const std::optional<double>& SurfacePolygon::textureRotationAngle() const
{
    ensureAlive("textureRotationAngle");
    return m_textureRotationAngle;
}

void SurfacePolygon::textureRotationAngle(std::optional<double> radians)
{
    ensureAlive("textureRotationAngle");
    m_textureRotationAngle = radians;
}

bool SurfacePolygon::visible() const
{
    ensureAlive("visible");
    return m_visible;
}

void SurfacePolygon::visible(bool value)
{
    ensureAlive("visible");
    m_visible = value;
}

const std::shared_ptr<Material>& SurfacePolygon::material() const
{
    ensureAlive("material");
    return m_material;
}

void SurfacePolygon::material(std::shared_ptr<Material> material)
{
    ensureAlive("material");
    m_material = std::move(material);
}

// -----------------------------
// Boundary
// -----------------------------

void SurfacePolygon::setFlatBoundary(BoundaryLoop points)
{
    ensureAlive("setFlatBoundary");

    if (!points.empty() && points.size() < kMinLoopPoints)
        throw ConfigurationError("SurfacePolygon::setFlatBoundary(): at least " + std::to_string(kMinLoopPoints) +
                                 " positions are required, got " + std::to_string(points.size()));

    if (points.empty())
        m_boundary = UnsetBoundary{};
    else
        m_boundary = FlatBoundary{std::move(points)};

    m_boundaryCounter->change();
}

void SurfacePolygon::setHierarchy(const HierarchyNode& root)
{
    ensureAlive("setHierarchy");

    FlattenedPolygonSet loops = m_flattener.flatten(root);

    m_boundary = FlattenedHierarchy{std::move(loops)};
    m_boundaryCounter->change();
}

const BoundaryLoop& SurfacePolygon::positions() const
{
    ensureAlive("positions");
    if (const auto* flat = std::get_if<FlatBoundary>(&m_boundary))
        return flat->positions;
    return kNoPositions;
}

const FlattenedPolygonSet& SurfacePolygon::flattenedHierarchy() const
{
    ensureAlive("flattenedHierarchy");
    if (const auto* hierarchy = std::get_if<FlattenedHierarchy>(&m_boundary))
        return hierarchy->loops;
    return kNoLoops;
}

const BoundaryState& SurfacePolygon::boundary() const
{
    ensureAlive("boundary");
    return m_boundary;
}

// -----------------------------
// Frame
// -----------------------------

void SurfacePolygon::tick(const RenderFrameContext& fc)
{
    ensureAlive("tick");
    validate();

    if (!m_visible)
        return;

    if (!m_rebuildMonitor.pending() && !m_renderable)
        return;

    const ShadowConfig config = currentConfig();
    if (m_rebuildMonitor.pending() || config != m_shadow)
        rebuild(config);

    if (!m_renderable)
        return;

    m_renderable->material(m_material);
    m_renderable->draw(fc);
}

Renderable* SurfacePolygon::renderable() const
{
    ensureAlive("renderable");
    return m_renderable.get();
}

bool SurfacePolygon::isDestroyed() const noexcept
{
    return m_destroyed;
}

void SurfacePolygon::destroy()
{
    ensureAlive("destroy");
    releaseRenderable();
    m_destroyed = true;
}

// -----------------------------
// Internals
// -----------------------------

void SurfacePolygon::ensureAlive(const char* method) const
{
    if (m_destroyed)
        throw UseAfterDestroy(std::string("SurfacePolygon::") + method + "(): polygon was destroyed");
}

void SurfacePolygon::validate() const
{
    if (!m_ellipsoid)
        throw InvariantViolation("SurfacePolygon::tick(): ellipsoid is required");

    if (!m_material)
        throw InvariantViolation("SurfacePolygon::tick(): material is required");

    if (!std::isfinite(m_granularity) || m_granularity <= 0.0)
        throw InvariantViolation("SurfacePolygon::tick(): granularity must be greater than zero, got " +
                                 std::to_string(m_granularity));
}

SurfacePolygon::ShadowConfig SurfacePolygon::currentConfig() const
{
    return ShadowConfig{m_ellipsoid, m_granularity, m_height, m_textureRotationAngle};
}

void SurfacePolygon::rebuild(const ShadowConfig& config)
{
    m_shadow = config;
    releaseRenderable();
    m_rebuildMonitor.sync();

    if (std::holds_alternative<UnsetBoundary>(m_boundary))
        return;

    PolygonGeometryDesc desc;
    desc.boundary     = m_boundary;
    desc.height       = m_height;
    desc.stRotation   = m_textureRotationAngle;
    desc.ellipsoid    = m_ellipsoid;
    desc.granularity  = m_granularity;
    desc.vertexFormat = SurfaceAppearance::kVertexFormat;

    const AppearanceRequirements requirements = SurfaceAppearance::requirements(m_height, *m_material);

    try
    {
        std::unique_ptr<PolygonGeometry> geometry = m_backend->buildGeometry(desc);
        if (!geometry)
            throw std::runtime_error("SurfacePolygon::tick(): backend returned no geometry");

        std::unique_ptr<Renderable> renderable = m_backend->buildRenderable(std::move(geometry), requirements);
        if (!renderable)
            throw std::runtime_error("SurfacePolygon::tick(): backend returned no renderable");

        m_renderable = std::move(renderable);
    }
    catch (const std::exception& e)
    {
        std::cerr << "SurfacePolygon::tick: build failed, will retry next tick: " << e.what() << '\n';
        m_rebuildMonitor.invalidate();
        throw;
    }
    catch (...)
    {
        m_rebuildMonitor.invalidate();
        throw;
    }
}

void SurfacePolygon::releaseRenderable() noexcept
{
    if (!m_renderable)
        return;

    m_renderable->destroy();
    m_renderable.reset();
}
