#pragma once

#include <glm/vec3.hpp>
#include <memory>
#include <string>

/// \brief Flat-color surface material for globe primitives.
///
/// CPU-side description only; renderables read it every frame, so edits
/// take effect on the next draw without rebuilding geometry.
class Material
{
public:
    Material();
    explicit Material(std::string name);

    // -----------------------------
    // Identity
    // -----------------------------
    const std::string& name() const noexcept;
    void               name(const std::string& name);

    // -----------------------------
    // Color
    // -----------------------------
    /// Base color in linear space.
    const glm::vec3& baseColor() const noexcept;
    void             baseColor(const glm::vec3& color) noexcept;

    /// Opacity in [0, 1]. 1 = fully opaque.
    float opacity() const noexcept;
    void  opacity(float value) noexcept;

    /// True when the material needs alpha blending.
    bool translucent() const noexcept;

    /// Yellow, half transparent.
    static std::shared_ptr<Material> makeDefault();

private:
    std::string m_name;
    glm::vec3   m_baseColor{1.0f, 1.0f, 1.0f};
    float       m_opacity = 1.0f;
};
