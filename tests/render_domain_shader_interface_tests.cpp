#include "render_domain/shader_interface.h"

#include <gtest/gtest.h>

#include <string>

using namespace relief::render_domain;

TEST(ShaderInterfaceTest, VertexLayoutIsTightlyPacked) {
    EXPECT_EQ(shader::kVertexStride, 36u);
    ASSERT_EQ(shader::kVertexAttributes.size(), 3u);

    for (size_t i = 0; i < shader::kVertexAttributes.size(); ++i) {
        const auto& attr = shader::kVertexAttributes[i];
        EXPECT_EQ(attr.location, i);
        EXPECT_EQ(attr.components, 3u);
        EXPECT_EQ(attr.offset, i * 3 * sizeof(float));
    }
}

TEST(ShaderInterfaceTest, ModeValues) {
    EXPECT_EQ(shader::normal_mode_value(relief::mesh::NormalMode::Flat), 0);
    EXPECT_EQ(shader::normal_mode_value(relief::mesh::NormalMode::Smooth), 1);
    EXPECT_EQ(shader::shading_mode_value(shader::ShadingMode::Lit), 0);
    EXPECT_EQ(shader::shading_mode_value(shader::ShadingMode::Wireframe), 3);
}

TEST(ShaderInterfaceTest, UniformNames) {
    EXPECT_EQ(std::string(shader::kViewProjUniform), "uViewProj");
    EXPECT_EQ(std::string(shader::kModelUniform), "uModel");
}
