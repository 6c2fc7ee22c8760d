#pragma once

#include "scene/Bounds.h"
#include "scene/SceneObject.h"

#include <vulkan/vulkan.h>
#include <cstdint>
#include <vector>

class IRenderPassEncoder;

// Where a mesh lives inside the shared vertex/index buffers
struct MeshRange {
    uint32_t firstIndex = 0;
    uint32_t indexCount = 0;
    int32_t vertexOffset = 0;
    BoundingSphere localBounds;     // Mesh space
};

/**
 * MeshBuffers - Shared vertex/index buffers plus the mesh table into them
 *
 * The buffers themselves are uploaded and owned by the asset side; this class
 * only references them. Read-only while a frame is being culled and drawn.
 *
 * Usage:
 *   MeshBuffers meshes(vertexBuffer, indexBuffer);
 *   MeshHandle cube = meshes.addMesh({0, 36, 0, BoundingSphere::fromAABB(cubeBounds)});
 *   ...
 *   meshes.bind(encoder);
 */
class MeshBuffers {
public:
    MeshBuffers(VkBuffer vertexBuffer, VkBuffer indexBuffer)
        : vertexBuffer_(vertexBuffer), indexBuffer_(indexBuffer) {}

    MeshHandle addMesh(const MeshRange& range);

    // nullptr when the handle was never registered
    const MeshRange* find(MeshHandle handle) const;

    // Bind the shared vertex (slot 0) and index (uint32) buffers
    void bind(IRenderPassEncoder& encoder) const;

    VkBuffer getVertexBuffer() const { return vertexBuffer_; }
    VkBuffer getIndexBuffer() const { return indexBuffer_; }
    size_t getMeshCount() const { return meshes_.size(); }

private:
    VkBuffer vertexBuffer_ = VK_NULL_HANDLE;
    VkBuffer indexBuffer_ = VK_NULL_HANDLE;
    std::vector<MeshRange> meshes_;
};
