#pragma once

#include <glm/glm.hpp>
#include <algorithm>
#include <limits>

// Axis-Aligned Bounding Box in mesh space
struct AABB {
    glm::vec3 min = glm::vec3(std::numeric_limits<float>::max());
    glm::vec3 max = glm::vec3(std::numeric_limits<float>::lowest());

    void expand(const glm::vec3& point) {
        min = glm::min(min, point);
        max = glm::max(max, point);
    }

    glm::vec3 getCenter() const {
        return (min + max) * 0.5f;
    }

    glm::vec3 getExtents() const {
        return (max - min) * 0.5f;
    }

    // Has been expanded at least once
    bool isValid() const {
        return min.x <= max.x && min.y <= max.y && min.z <= max.z;
    }
};

// Bounding sphere used for frustum tests (xyz = center, w = radius when packed)
struct BoundingSphere {
    glm::vec3 center = glm::vec3(0.0f);
    float radius = 0.0f;

    static BoundingSphere fromAABB(const AABB& box) {
        return {box.getCenter(), glm::length(box.getExtents())};
    }

    glm::vec4 packed() const { return glm::vec4(center, radius); }

    // Sphere enclosing this one after an affine transform. The radius is scaled
    // by the largest axis scale so non-uniform scale stays conservative.
    // Must stay identical to worldSphere() in opaque_cull.comp.
    BoundingSphere transformed(const glm::mat4& transform) const {
        glm::vec3 worldCenter = glm::vec3(transform * glm::vec4(center, 1.0f));
        float scale = std::max(glm::length(glm::vec3(transform[0])),
                      std::max(glm::length(glm::vec3(transform[1])),
                               glm::length(glm::vec3(transform[2]))));
        return {worldCenter, radius * scale};
    }
};
