#include "Frustum.h"

Frustum Frustum::fromViewProj(const glm::mat4& viewProj) {
    // GLM is column-major, so transpose to get row access
    glm::mat4 m = glm::transpose(viewProj);

    Frustum frustum;
    frustum.planes[0] = m[3] + m[0];    // Left
    frustum.planes[1] = m[3] - m[0];    // Right
    frustum.planes[2] = m[3] + m[1];    // Bottom
    frustum.planes[3] = m[3] - m[1];    // Top
    frustum.planes[4] = m[2];           // Near (z_clip >= 0)
    frustum.planes[5] = m[3] - m[2];    // Far  (z_clip <= w_clip)

    for (auto& plane : frustum.planes) {
        float len = glm::length(glm::vec3(plane));
        if (len > 0.0001f) {
            plane /= len;
        }
    }
    return frustum;
}

bool Frustum::intersectsSphere(const BoundingSphere& sphere) const {
    for (const auto& plane : planes) {
        if (glm::dot(glm::vec3(plane), sphere.center) + plane.w < -sphere.radius) {
            return false;
        }
    }
    return true;
}
