#pragma once

#include <glm/glm.hpp>
#include <cstdint>

using MeshHandle = uint32_t;
using MaterialHandle = uint32_t;

constexpr MeshHandle INVALID_MESH_HANDLE = ~0u;
constexpr MaterialHandle INVALID_MATERIAL_HANDLE = ~0u;

// One opaque object as handed over by the scene manager. The object's identity
// for a frame is its index in that frame's object list.
struct SceneObject {
    MeshHandle mesh = INVALID_MESH_HANDLE;
    MaterialHandle material = INVALID_MATERIAL_HANDLE;
    glm::mat4 transform = glm::mat4(1.0f);
};
