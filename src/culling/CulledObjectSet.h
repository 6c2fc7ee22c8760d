#pragma once

// ============================================================================
// CulledObjectSet.h - Result of culling one frame's opaque objects
// ============================================================================
//
// Produced by a culler, consumed by OpaquePass::prepass and OpaquePass::draw
// in that order, and dropped at the end of the frame. Exactly one strategy
// case is populated and it always matches the renderer's strategy.
//

#include "core/RenderMode.h"
#include "scene/SceneObject.h"

#include <vulkan/vulkan.h>
#include <cstdint>
#include <vector>

// One host-side batch: every surviving object sharing (mesh, material).
// Instances [firstInstance, firstInstance + instanceCount) of the frame's
// instance buffer belong to this batch.
struct HostDrawCall {
    MeshHandle mesh = INVALID_MESH_HANDLE;
    MaterialHandle material = INVALID_MATERIAL_HANDLE;
    uint32_t firstInstance = 0;
    uint32_t instanceCount = 0;
};

// Indirect draws written by the cull compute shader
struct DeviceDrawData {
    VkBuffer indirectBuffer = VK_NULL_HANDLE;
    VkDeviceSize offset = 0;
    uint32_t drawCount = 0;         // One command per (mesh, material) batch
    uint32_t stride = 0;
};

using CulledCalls = ModeData<std::vector<HostDrawCall>, DeviceDrawData>;

struct CulledObjectSet {
    CulledCalls calls;

    // Per-object output binding the vertex stage reads (slot 1 in both passes)
    VkDescriptorSet outputBindGroup = VK_NULL_HANDLE;

    uint32_t frameIndex = 0;

    CullingStrategy strategy() const { return calls.strategy(); }
};
