#pragma once

#include "CulledObjectSet.h"
#include "Frustum.h"
#include "core/DescriptorManager.h"
#include "core/FrameBuffered.h"
#include "core/vulkan/VmaBuffer.h"
#include "scene/CameraSnapshot.h"
#include "scene/SceneObject.h"

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <vk_mem_alloc.h>
#include <glm/glm.hpp>
#include <memory>
#include <vector>

class MeshBuffers;
class MaterialManager;
class ShaderInterfaces;

// Per-instance data read by the opaque vertex shaders (std430, BINDING_CULL_OUTPUT_INSTANCES)
struct HostInstanceData {
    glm::mat4 model;
    glm::mat4 modelView;
    glm::mat4 modelViewProj;
    glm::mat4 invTransModelView;
    uint32_t materialIndex;
    uint32_t _pad0;
    uint32_t _pad1;
    uint32_t _pad2;
};
static_assert(sizeof(HostInstanceData) == 272, "HostInstanceData must match std430 layout");

// Visibility and batching for one frame, before anything touches the GPU
struct HostBatches {
    std::vector<HostDrawCall> calls;
    // Object index for each instance slot, in batch-range order
    std::vector<uint32_t> instanceObjects;
};

/**
 * Frustum-test every object and group the survivors by (mesh, material).
 *
 * Batches appear in the order their (mesh, material) pair is first seen in
 * `objects`, and instances within a batch keep object order, so the result
 * is a pure function of its inputs. Instance ranges are contiguous and
 * packed back to back starting at 0.
 *
 * Raises UnresolvedHandleError when an object names an unknown mesh or material.
 */
HostBatches buildHostBatches(const Frustum& frustum,
                             const std::vector<SceneObject>& objects,
                             const MeshBuffers& meshes,
                             const MaterialManager& materials);

// Per-instance shader data for `batches`, in instance order
std::vector<HostInstanceData> packInstances(const HostBatches& batches,
                                            const std::vector<SceneObject>& objects,
                                            const CameraSnapshot& camera,
                                            const MaterialManager& materials);

struct HostCullArgs {
    const CameraSnapshot& camera;
    const std::vector<SceneObject>& objects;
    const MeshBuffers& meshes;
    const MaterialManager& materials;
    uint32_t frameIndex;
};

/**
 * HostCuller - Visibility and batching on the CPU
 *
 * Uploads the frame's instance data into a host-visible storage buffer that
 * the opaque pipelines read at slot 1. Each frame slot owns its buffer and
 * descriptor set; the buffer grows (and the set is rewritten) when a frame
 * has more survivors than it can hold.
 */
class HostCuller {
public:
    struct ConstructToken { explicit ConstructToken() = default; };
    explicit HostCuller(ConstructToken) {}

    struct InitInfo {
        const vk::raii::Device* raiiDevice = nullptr;
        VmaAllocator allocator = VK_NULL_HANDLE;
        DescriptorManager::Pool* descriptorPool = nullptr;
        std::shared_ptr<const ShaderInterfaces> interfaces;
        uint32_t framesInFlight = 2;
        uint32_t initialInstanceCapacity = 1024;
    };

    static std::unique_ptr<HostCuller> create(const InitInfo& info);

    CulledObjectSet cull(const HostCullArgs& args);

    uint32_t getInstanceCapacity(uint32_t frameIndex) const { return frames_.at(frameIndex).capacity; }

private:
    struct FrameResources {
        VmaBuffer uniforms;
        VmaBuffer instances;
        uint32_t capacity = 0;
        VkDescriptorSet outputSet = VK_NULL_HANDLE;
    };

    bool initInternal(const InitInfo& info);
    bool createInstanceBuffer(FrameResources& frame, uint32_t capacity);
    void writeOutputSet(const FrameResources& frame);
    void ensureCapacity(FrameResources& frame, uint32_t frameIndex, uint32_t instanceCount);

    VkDevice device_ = VK_NULL_HANDLE;
    VmaAllocator allocator_ = VK_NULL_HANDLE;
    std::shared_ptr<const ShaderInterfaces> interfaces_;
    FrameBuffered<FrameResources> frames_;
};
