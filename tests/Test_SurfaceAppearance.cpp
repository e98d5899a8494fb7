#include <gtest/gtest.h>

#include "Material.hpp"
#include "SurfaceAppearance.hpp"

TEST(Material, DefaultIsHalfTransparentYellow)
{
    const auto material = Material::makeDefault();

    EXPECT_EQ(material->name(), "Color");
    EXPECT_FLOAT_EQ(material->baseColor().r, 1.0f);
    EXPECT_FLOAT_EQ(material->baseColor().g, 1.0f);
    EXPECT_FLOAT_EQ(material->baseColor().b, 0.0f);
    EXPECT_TRUE(material->translucent());

    // Each call hands out a fresh material.
    EXPECT_NE(Material::makeDefault(), material);
}

TEST(Material, OpacityIsClamped)
{
    Material material;
    EXPECT_FALSE(material.translucent());

    material.opacity(2.0f);
    EXPECT_FLOAT_EQ(material.opacity(), 1.0f);

    material.opacity(-1.0f);
    EXPECT_FLOAT_EQ(material.opacity(), 0.0f);
    EXPECT_TRUE(material.translucent());
}

TEST(SurfaceAppearance, RequirementsFollowHeightAndMaterial)
{
    Material opaque;
    Material glass;
    glass.opacity(0.25f);

    const AppearanceRequirements ground = SurfaceAppearance::requirements(0.0, opaque);
    EXPECT_EQ(ground.vertexFormat, VertexFormat::positionAndSt());
    EXPECT_FALSE(ground.aboveGround);
    EXPECT_FALSE(ground.translucent);

    const AppearanceRequirements raised = SurfaceAppearance::requirements(1.0, glass);
    EXPECT_TRUE(raised.aboveGround);
    EXPECT_TRUE(raised.translucent);

    EXPECT_FALSE(SurfaceAppearance::requirements(-5.0, opaque).aboveGround);
}
