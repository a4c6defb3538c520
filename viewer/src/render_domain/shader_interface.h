#pragma once

#include "relief/mesh.h"

#include <array>
#include <cstddef>
#include <cstdint>

// Contract with the shading stage. A terrain program declares
//
//   layout(location = 0) in vec3 aPosition;
//   layout(location = 1) in vec3 aColor;
//   layout(location = 2) in vec3 aNormal;
//   uniform mat4 uViewProj;
//   uniform mat4 uModel;
//   uniform int uShadingMode;
//   uniform int uNormalMode;
//
// and is fed one DrawItem per draw call.
namespace relief::render_domain::shader {

inline constexpr const char* kViewProjUniform = "uViewProj";
inline constexpr const char* kModelUniform = "uModel";
inline constexpr const char* kShadingModeUniform = "uShadingMode";
inline constexpr const char* kNormalModeUniform = "uNormalMode";

enum class ShadingMode : int {
    Lit = 0,       // Vertex color times a fixed directional light.
    Unlit = 1,     // Vertex color only.
    Normals = 2,   // Normal mapped to RGB, for debugging.
    Wireframe = 3, // Line list from mesh::build_edge_indices over the same vertices.
};

struct VertexAttribute {
    uint32_t location = 0;
    uint32_t components = 0;
    size_t offset = 0; // Bytes from the start of a Vertex.
};

inline constexpr size_t kVertexStride = sizeof(mesh::Vertex);

inline constexpr std::array<VertexAttribute, 3> kVertexAttributes = {{
    {0, 3, offsetof(mesh::Vertex, position)},
    {1, 3, offsetof(mesh::Vertex, color)},
    {2, 3, offsetof(mesh::Vertex, normal)},
}};

// Value for uNormalMode: 0 flat, 1 smooth.
constexpr int normal_mode_value(mesh::NormalMode mode) {
    return mode == mesh::NormalMode::Flat ? 0 : 1;
}

constexpr int shading_mode_value(ShadingMode mode) {
    return static_cast<int>(mode);
}

} // namespace relief::render_domain::shader
