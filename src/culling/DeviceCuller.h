#pragma once

#include "CulledObjectSet.h"
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
#include <optional>
#include <string>
#include <vector>

class ICommandEncoder;
class MeshBuffers;
class MaterialManager;
class ShaderInterfaces;

// One object as seen by opaque_cull.comp (std430)
struct GPUCullObject {
    glm::mat4 model;
    glm::vec4 localSphere;          // xyz = center (mesh space), w = radius
    uint32_t batchIndex;            // Index of the object's indirect command
    uint32_t materialIndex;         // Dense device material index
    uint32_t _pad0;
    uint32_t _pad1;
};
static_assert(sizeof(GPUCullObject) == 96, "GPUCullObject size mismatch with shader");

// Matches VkDrawIndexedIndirectCommand
struct GPUDrawIndexedIndirectCommand {
    uint32_t indexCount;
    uint32_t instanceCount;
    uint32_t firstIndex;
    int32_t vertexOffset;
    uint32_t firstInstance;
};
static_assert(sizeof(GPUDrawIndexedIndirectCommand) == 20, "GPUDrawIndexedIndirectCommand size mismatch");
static_assert(sizeof(GPUDrawIndexedIndirectCommand) == sizeof(VkDrawIndexedIndirectCommand),
              "GPUDrawIndexedIndirectCommand must alias VkDrawIndexedIndirectCommand");

struct OpaqueCullUniforms {
    glm::mat4 viewMatrix;
    glm::mat4 projMatrix;
    glm::mat4 viewProjMatrix;
    glm::vec4 frustumPlanes[6];     // xyz = inward normal, w = distance
    glm::vec4 cameraPosition;
    uint32_t objectCount;
    uint32_t batchCount;
    uint32_t _pad0;
    uint32_t _pad1;
};
static_assert(sizeof(OpaqueCullUniforms) == 320, "OpaqueCullUniforms must match std140 layout");

/**
 * Everything the device culler uploads for a frame. No visibility is decided
 * here: commands start with instanceCount = 0 and each batch owns a range of
 * the visible index buffer large enough for all of its objects.
 */
struct DeviceCullPlan {
    std::vector<GPUDrawIndexedIndirectCommand> commands;    // First-seen (mesh, material) order
    std::vector<GPUCullObject> objects;                     // Object order
};

// Raises CapacityExceededError when objects.size() > maxObjects, and
// UnresolvedHandleError for unknown meshes or materials.
DeviceCullPlan buildDeviceCullPlan(const std::vector<SceneObject>& objects,
                                   const MeshBuffers& meshes,
                                   const MaterialManager& materials,
                                   uint32_t maxObjects);

OpaqueCullUniforms makeCullUniforms(const CameraSnapshot& camera,
                                    uint32_t objectCount, uint32_t batchCount);

struct DeviceCullArgs {
    ICommandEncoder& encoder;
    const CameraSnapshot& camera;
    const std::vector<SceneObject>& objects;
    const MeshBuffers& meshes;
    const MaterialManager& materials;
    uint32_t frameIndex;
};

/**
 * DeviceCuller - Visibility and batching in a compute shader
 *
 * cull() uploads the frame's plan, then records into the encoder:
 *   1. copy command templates -> indirect buffer (resets instance counts)
 *   2. transfer -> compute barrier
 *   3. opaque_cull.comp dispatch, one invocation per object
 *   4. compute -> indirect draw / vertex barrier
 * The opaque pass then issues one indirect draw over all batches. Nothing is
 * read back on the frame path.
 */
class DeviceCuller {
public:
    static constexpr uint32_t WORKGROUP_SIZE = 64;

    struct ConstructToken { explicit ConstructToken() = default; };
    explicit DeviceCuller(ConstructToken) {}

    struct InitInfo {
        const vk::raii::Device* raiiDevice = nullptr;
        VmaAllocator allocator = VK_NULL_HANDLE;
        DescriptorManager::Pool* descriptorPool = nullptr;
        std::shared_ptr<const ShaderInterfaces> interfaces;
        std::string shaderPath;
        uint32_t framesInFlight = 2;
        uint32_t maxObjects = 8192;
        bool enableReadback = false;
    };

    static std::unique_ptr<DeviceCuller> create(const InitInfo& info);

    CulledObjectSet cull(const DeviceCullArgs& args);

    // Indirect commands written for frameIndex. Only valid with enableReadback,
    // after the caller has waited for that frame's submission to complete.
    std::vector<GPUDrawIndexedIndirectCommand> readbackCommands(uint32_t frameIndex) const;

    uint32_t getMaxObjects() const { return maxObjects_; }

private:
    struct FrameResources {
        VmaBuffer cullUniforms;
        VmaBuffer outputUniforms;
        VmaBuffer objects;
        VmaBuffer commandTemplates;
        VmaBuffer indirect;
        VmaBuffer visible;
        VkDescriptorSet computeSet = VK_NULL_HANDLE;
        VkDescriptorSet outputSet = VK_NULL_HANDLE;
        uint32_t batchCount = 0;
    };

    bool initInternal(const InitInfo& info);
    bool createPipeline(const vk::raii::Device& device, const std::string& shaderPath);
    bool createFrameBuffers(FrameResources& frame) const;
    void writeDescriptorSets(const FrameResources& frame) const;

    VkDevice device_ = VK_NULL_HANDLE;
    VmaAllocator allocator_ = VK_NULL_HANDLE;
    std::shared_ptr<const ShaderInterfaces> interfaces_;
    uint32_t maxObjects_ = 0;
    bool enableReadback_ = false;

    std::optional<vk::raii::PipelineLayout> pipelineLayout_;
    std::optional<vk::raii::Pipeline> pipeline_;

    FrameBuffered<FrameResources> frames_;
};
