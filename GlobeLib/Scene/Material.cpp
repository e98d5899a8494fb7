#include "Material.hpp"

#include <algorithm>
#include <utility>

Material::Material() : m_name{"Color"}
{
}

Material::Material(std::string name) : m_name{std::move(name)}
{
}

const std::string& Material::name() const noexcept
{
    return m_name;
}

void Material::name(const std::string& name)
{
    m_name = name;
}

const glm::vec3& Material::baseColor() const noexcept
{
    return m_baseColor;
}

void Material::baseColor(const glm::vec3& color) noexcept
{
    m_baseColor = color;
}

float Material::opacity() const noexcept
{
    return m_opacity;
}

void Material::opacity(float value) noexcept
{
    m_opacity = std::clamp(value, 0.0f, 1.0f);
}

bool Material::translucent() const noexcept
{
    return m_opacity < 1.0f;
}

std::shared_ptr<Material> Material::makeDefault()
{
    auto material = std::make_shared<Material>("Color");
    material->baseColor({1.0f, 1.0f, 0.0f});
    material->opacity(0.5f);
    return material;
}
