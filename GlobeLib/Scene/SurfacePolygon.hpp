#pragma once

#include <glm/trigonometric.hpp>
#include <memory>
#include <optional>

#include "BoundaryTypes.hpp"
#include "ChangeCounter.hpp"
#include "Ellipsoid.hpp"
#include "HierarchyFlattener.hpp"
#include "Material.hpp"

class HoleEliminator;
class RenderBackend;
class Renderable;
struct RenderFrameContext;

/**
 * @brief Initial configuration of a SurfacePolygon.
 *
 * When both `positions` and `hierarchy` are given, the hierarchy is used.
 */
struct SurfacePolygonOptions
{
    EllipsoidPtr              ellipsoid            = Ellipsoid::wgs84();
    double                    granularity          = glm::radians(1.0);
    double                    height               = 0.0;
    std::optional<double>     textureRotationAngle = std::nullopt;
    bool                      visible              = true;
    std::shared_ptr<Material> material             = Material::makeDefault();

    std::optional<BoundaryLoop>  positions;
    std::optional<HierarchyNode> hierarchy;
};

/**
 * @brief Filled polygon draped on the ellipsoid surface.
 *
 * Owns its renderable and rebuilds it lazily on tick() when the boundary
 * was replaced or when any geometry-affecting setting (ellipsoid,
 * granularity, height, texture rotation) differs from the values used for
 * the last build. Material and visibility changes never rebuild.
 *
 * The ellipsoid is compared by identity: assigning a different but equal
 * ellipsoid object still rebuilds.
 *
 * After destroy(), every method except isDestroyed() throws UseAfterDestroy.
 */
class SurfacePolygon
{
public:
    /**
     * @param holeEliminator Used to flatten hierarchies; must outlive the polygon.
     * @param backend        Builds geometry and renderables; must outlive the polygon.
     * @throws std::invalid_argument if a collaborator is null.
     * @throws ConfigurationError if the initial boundary is invalid.
     */
    SurfacePolygon(const HoleEliminator* holeEliminator, RenderBackend* backend, SurfacePolygonOptions options = {});
    ~SurfacePolygon() noexcept;

    SurfacePolygon(const SurfacePolygon&)            = delete;
    SurfacePolygon& operator=(const SurfacePolygon&) = delete;

    // -----------------------------
    // Render configuration
    // -----------------------------
    [[nodiscard]] const EllipsoidPtr& ellipsoid() const;
    void                              ellipsoid(EllipsoidPtr ellipsoid);

    /// Max angle between tessellated vertices, in radians.
    [[nodiscard]] double granularity() const;
    void                 granularity(double radians);

    /// Offset above the ellipsoid surface, in meters.
    [[nodiscard]] double height() const;
    void                 height(double meters);

    [[nodiscard]] const std::optional<double>& textureRotationAngle() const;
    void                                       textureRotationAngle(std::optional<double> radians);

    [[nodiscard]] bool visible() const;
    void               visible(bool value);

    [[nodiscard]] const std::shared_ptr<Material>& material() const;
    void                                           material(std::shared_ptr<Material> material);

    // -----------------------------
    // Boundary
    // -----------------------------

    /**
     * @brief Use a single ring as the boundary.
     *
     * An empty ring clears the boundary. Always requests a rebuild.
     * @throws ConfigurationError if the ring has 1 or 2 points.
     */
    void setFlatBoundary(BoundaryLoop points);

    /**
     * @brief Use a nested outer/hole/island hierarchy as the boundary.
     * @throws ConfigurationError if any ring is too short or a hole cannot be
     *         merged. The stored boundary is left untouched in that case.
     */
    void setHierarchy(const HierarchyNode& root);

    /// Flat boundary, empty unless the boundary was set with setFlatBoundary().
    [[nodiscard]] const BoundaryLoop& positions() const;

    /// Flattened loops, empty unless the boundary was set with setHierarchy().
    [[nodiscard]] const FlattenedPolygonSet& flattenedHierarchy() const;

    [[nodiscard]] const BoundaryState& boundary() const;

    // -----------------------------
    // Frame
    // -----------------------------

    /**
     * @brief Rebuild if needed, assign the material and draw.
     * @throws InvariantViolation if the ellipsoid or material is missing or
     *         the granularity is not a positive finite number.
     *
     * Exceptions from the backend propagate; the polygon is then left
     * without a renderable and retries the build on the next tick.
     */
    void tick(const RenderFrameContext& fc);

    /// Current renderable, or null. Owned by the polygon.
    [[nodiscard]] Renderable* renderable() const;

    [[nodiscard]] bool isDestroyed() const noexcept;

    /// Release the renderable. The polygon is unusable afterwards.
    void destroy();

private:
    /// Settings the current renderable was built with.
    struct ShadowConfig
    {
        EllipsoidPtr          ellipsoid;
        double                granularity = 0.0;
        double                height      = 0.0;
        std::optional<double> textureRotationAngle;

        bool operator==(const ShadowConfig&) const = default;
    };

    void         ensureAlive(const char* method) const;
    void         validate() const;
    ShadowConfig currentConfig() const;
    void         rebuild(const ShadowConfig& config);
    void         releaseRenderable() noexcept;

private:
    HierarchyFlattener m_flattener;
    RenderBackend*     m_backend = nullptr;

    EllipsoidPtr              m_ellipsoid;
    double                    m_granularity = 0.0;
    double                    m_height      = 0.0;
    std::optional<double>     m_textureRotationAngle;
    bool                      m_visible = true;
    std::shared_ptr<Material> m_material;

    BoundaryState m_boundary;

    ChangeCounterPtr m_boundaryCounter;
    ChangeMonitor    m_rebuildMonitor;
    ShadowConfig     m_shadow;

    std::unique_ptr<Renderable> m_renderable;
    bool                        m_destroyed = false;
};
