#pragma once

#include "scene/Bounds.h"

#include <glm/glm.hpp>
#include <array>

/**
 * Frustum - Six normalized clip planes extracted from a view-projection matrix
 *
 * Plane order: left, right, bottom, top, near, far. Normals point inwards,
 * so a point p is inside a plane when dot(n, p) + d >= 0.
 *
 * This same test is used in:
 * - HostCuller for the host strategy
 * - opaque_cull.comp for the device strategy (planes uploaded as-is)
 */
struct Frustum {
    std::array<glm::vec4, 6> planes{};

    // Gribb/Hartmann extraction for a Vulkan (0..1 depth) projection
    static Frustum fromViewProj(const glm::mat4& viewProj);

    // A sphere touching the frustum boundary counts as visible
    bool intersectsSphere(const BoundingSphere& sphere) const;
};
