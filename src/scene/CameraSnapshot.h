#pragma once

#include <glm/glm.hpp>

/**
 * CameraSnapshot - The camera as seen by one frame
 *
 * Supplied once per frame by the renderer and immutable for the frame.
 * Projection follows the Vulkan convention (depth 0..1).
 */
struct CameraSnapshot {
    glm::mat4 view = glm::mat4(1.0f);
    glm::mat4 projection = glm::mat4(1.0f);

    glm::mat4 viewProj() const { return projection * view; }

    glm::vec3 position() const {
        return glm::vec3(glm::inverse(view)[3]);
    }
};
