#include "OpaquePass.h"
#include "core/CullingErrors.h"
#include "core/MeshBuffers.h"
#include "core/interfaces/IRenderPassEncoder.h"
#include "core/material/MaterialManager.h"

namespace {

// Resolved before anything is recorded so a mismatch leaves the encoder untouched
struct DeviceBindings {
    VkDescriptorSet materials = VK_NULL_HANDLE;
    VkDescriptorSet textures = VK_NULL_HANDLE;
};

void requireMatchingStrategy(const CulledObjectSet& culled, const TextureBinding& textures,
                             const char* pass) {
    if (culled.strategy() != textures.strategy()) {
        CullingErrors::fail<StrategyMismatchError>(
            "OpaquePass::%s: culled set is %s but texture binding is %s",
            pass, toString(culled.strategy()), toString(textures.strategy()));
    }
}

DeviceBindings resolveDeviceBindings(const CulledObjectSet& culled, const TextureBinding& textures,
                                     const MaterialManager& materials) {
    DeviceBindings bindings;
    if (culled.calls.isDevice()) {
        bindings.materials = materials.getDeviceBindGroup();
        bindings.textures = textures.asDevice();
    }
    return bindings;
}

// One drawIndexed per batch; the material set is only rebound when it changes
void recordHostDraws(IRenderPassEncoder& encoder, const std::vector<HostDrawCall>& draws,
                     const MeshBuffers& meshes, const MaterialManager& materials,
                     uint32_t materialSlot) {
    MaterialHandle boundMaterial = INVALID_MATERIAL_HANDLE;
    for (const HostDrawCall& call : draws) {
        const MeshRange* mesh = meshes.find(call.mesh);
        if (!mesh) {
            CullingErrors::fail<UnresolvedHandleError>(
                "OpaquePass: batch references unknown mesh %u", call.mesh);
        }

        if (call.material != boundMaterial) {
            encoder.setBindGroup(materialSlot, materials.getBindGroup(call.material));
            boundMaterial = call.material;
        }

        encoder.drawIndexed(mesh->indexCount, call.instanceCount,
                            mesh->firstIndex, mesh->vertexOffset, call.firstInstance);
    }
}

void recordDeviceDraws(IRenderPassEncoder& encoder, const DeviceDrawData& data,
                       const DeviceBindings& bindings, uint32_t materialSlot, uint32_t textureSlot) {
    encoder.setBindGroup(materialSlot, bindings.materials);
    encoder.setBindGroup(textureSlot, bindings.textures);
    if (data.drawCount > 0) {
        encoder.drawIndexedIndirect(data.indirectBuffer, data.offset, data.drawCount, data.stride);
    }
}

} // namespace

OpaquePass::OpaquePass(std::shared_ptr<const GraphicsPipeline> depthPipeline,
                       std::shared_ptr<const GraphicsPipeline> opaquePipeline)
    : depthPipeline_(std::move(depthPipeline))
    , opaquePipeline_(std::move(opaquePipeline)) {
    if (!depthPipeline_ || !opaquePipeline_) {
        CullingErrors::fail<ContractViolation>("OpaquePass: depth and opaque pipelines are required");
    }
}

CulledObjectSet OpaquePass::cullOpaque(const OpaquePassCullArgs& args) const {
    return args.culler.match(
        [&](HostCuller* host) {
            return host->cull(HostCullArgs{
                args.camera, args.objects, args.meshes, args.materials, args.frameIndex});
        },
        [&](DeviceCuller* device) {
            return device->cull(DeviceCullArgs{
                args.encoder, args.camera, args.objects, args.meshes, args.materials, args.frameIndex});
        });
}

void OpaquePass::prepass(const OpaquePassPrepassArgs& args) const {
    using Slots = OpaquePassSlots::Prepass;

    requireMatchingStrategy(args.culledObjects, args.textureBindGroup, "prepass");
    DeviceBindings deviceBindings =
        resolveDeviceBindings(args.culledObjects, args.textureBindGroup, args.materials);

    args.meshes.bind(args.encoder);
    args.encoder.setPipeline(*depthPipeline_);
    args.encoder.setBindGroup(Slots::SAMPLERS, args.samplerBindGroup);
    args.encoder.setBindGroup(Slots::CULLED_OUTPUT, args.culledObjects.outputBindGroup);

    args.culledObjects.calls.match(
        [&](const std::vector<HostDrawCall>& draws) {
            recordHostDraws(args.encoder, draws, args.meshes, args.materials, Slots::HOST_MATERIAL);
        },
        [&](const DeviceDrawData& data) {
            recordDeviceDraws(args.encoder, data, deviceBindings,
                              Slots::DEVICE_MATERIALS, Slots::DEVICE_TEXTURES);
        });
}

void OpaquePass::draw(const OpaquePassDrawArgs& args) const {
    using Slots = OpaquePassSlots::Draw;

    requireMatchingStrategy(args.culledObjects, args.textureBindGroup, "draw");
    DeviceBindings deviceBindings =
        resolveDeviceBindings(args.culledObjects, args.textureBindGroup, args.materials);

    args.meshes.bind(args.encoder);
    args.encoder.setPipeline(*opaquePipeline_);
    args.encoder.setBindGroup(Slots::SAMPLERS, args.samplerBindGroup);
    args.encoder.setBindGroup(Slots::CULLED_OUTPUT, args.culledObjects.outputBindGroup);
    args.encoder.setBindGroup(Slots::DIRECTIONAL_LIGHT, args.directionalLightBindGroup);
    args.encoder.setBindGroup(Slots::SHADER_UNIFORMS, args.shaderUniformBindGroup);

    args.culledObjects.calls.match(
        [&](const std::vector<HostDrawCall>& draws) {
            recordHostDraws(args.encoder, draws, args.meshes, args.materials, Slots::HOST_MATERIAL);
        },
        [&](const DeviceDrawData& data) {
            recordDeviceDraws(args.encoder, data, deviceBindings,
                              Slots::DEVICE_MATERIALS, Slots::DEVICE_TEXTURES);
        });
}
