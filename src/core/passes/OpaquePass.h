#pragma once

#include "core/RenderMode.h"
#include "core/pipeline/GraphicsPipeline.h"
#include "culling/Culler.h"
#include "culling/CulledObjectSet.h"
#include "scene/CameraSnapshot.h"
#include "scene/SceneObject.h"

#include <vulkan/vulkan.h>
#include <cstdint>
#include <memory>
#include <variant>
#include <vector>

class ICommandEncoder;
class IRenderPassEncoder;
class MeshBuffers;
class MaterialManager;

// Descriptor set slots of the two opaque pipelines. The pipeline layouts are
// built against these; changing one is a shader interface change.
namespace OpaquePassSlots {

struct Prepass {
    static constexpr uint32_t SAMPLERS = 0;
    static constexpr uint32_t CULLED_OUTPUT = 1;
    static constexpr uint32_t HOST_MATERIAL = 2;        // Per batch
    static constexpr uint32_t DEVICE_MATERIALS = 2;     // Whole material table
    static constexpr uint32_t DEVICE_TEXTURES = 3;
};

struct Draw {
    static constexpr uint32_t SAMPLERS = 0;
    static constexpr uint32_t CULLED_OUTPUT = 1;
    static constexpr uint32_t DIRECTIONAL_LIGHT = 2;
    static constexpr uint32_t SHADER_UNIFORMS = 3;
    static constexpr uint32_t HOST_MATERIAL = 4;
    static constexpr uint32_t DEVICE_MATERIALS = 4;
    static constexpr uint32_t DEVICE_TEXTURES = 5;
};

static_assert(Prepass::SAMPLERS == Draw::SAMPLERS && Prepass::CULLED_OUTPUT == Draw::CULLED_OUTPUT,
              "Sampler and culled output slots are shared by both opaque pipelines");
static_assert(Prepass::HOST_MATERIAL == Prepass::DEVICE_MATERIALS && Draw::HOST_MATERIAL == Draw::DEVICE_MATERIALS,
              "Material slot must not depend on the culling strategy");
static_assert(Prepass::DEVICE_TEXTURES == Prepass::DEVICE_MATERIALS + 1 && Draw::DEVICE_TEXTURES == Draw::DEVICE_MATERIALS + 1,
              "Texture array follows the material table");

} // namespace OpaquePassSlots

// Bindless texture array; only the device strategy binds one
using TextureBinding = ModeData<std::monostate, VkDescriptorSet>;

struct OpaquePassCullArgs {
    ICommandEncoder& encoder;
    CullerRef culler;
    const MeshBuffers& meshes;
    const MaterialManager& materials;
    const CameraSnapshot& camera;
    const std::vector<SceneObject>& objects;
    uint32_t frameIndex;
};

struct OpaquePassPrepassArgs {
    IRenderPassEncoder& encoder;
    const MeshBuffers& meshes;
    const MaterialManager& materials;
    VkDescriptorSet samplerBindGroup;
    TextureBinding textureBindGroup;
    const CulledObjectSet& culledObjects;
};

struct OpaquePassDrawArgs {
    IRenderPassEncoder& encoder;
    const MeshBuffers& meshes;
    const MaterialManager& materials;
    VkDescriptorSet samplerBindGroup;
    VkDescriptorSet directionalLightBindGroup;
    VkDescriptorSet shaderUniformBindGroup;
    TextureBinding textureBindGroup;
    const CulledObjectSet& culledObjects;
};

/**
 * OpaquePass - Culls opaque objects and records the depth prepass and lit pass
 *
 * Per frame:
 *   CulledObjectSet culled = pass.cullOpaque({...});   // before the render pass
 *   pass.prepass({..., culled});                       // depth-only
 *   pass.draw({..., culled});                          // lit, depth-equal
 *
 * Both recording calls branch once on the strategy of the culled set. Host
 * sets draw one drawIndexed per batch; device sets draw every batch with a
 * single drawIndexedIndirect.
 */
class OpaquePass {
public:
    OpaquePass(std::shared_ptr<const GraphicsPipeline> depthPipeline,
               std::shared_ptr<const GraphicsPipeline> opaquePipeline);

    CulledObjectSet cullOpaque(const OpaquePassCullArgs& args) const;

    void prepass(const OpaquePassPrepassArgs& args) const;
    void draw(const OpaquePassDrawArgs& args) const;

private:
    std::shared_ptr<const GraphicsPipeline> depthPipeline_;
    std::shared_ptr<const GraphicsPipeline> opaquePipeline_;
};
