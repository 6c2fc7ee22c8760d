#include "DeviceCuller.h"
#include "Frustum.h"
#include "core/CullingErrors.h"
#include "core/MeshBuffers.h"
#include "core/ShaderInterfaces.h"
#include "core/interfaces/ICommandEncoder.h"
#include "core/material/MaterialManager.h"
#include "core/pipeline/ComputePipelineBuilder.h"
#include "shaders/bindings.h"

#include <SDL3/SDL_log.h>
#include <cstring>
#include <unordered_map>

static_assert(DeviceCuller::WORKGROUP_SIZE == OPAQUE_CULL_WORKGROUP_SIZE,
              "Workgroup size must match opaque_cull.comp");

DeviceCullPlan buildDeviceCullPlan(const std::vector<SceneObject>& objects,
                                   const MeshBuffers& meshes,
                                   const MaterialManager& materials,
                                   uint32_t maxObjects) {
    if (objects.size() > maxObjects) {
        CullingErrors::fail<CapacityExceededError>(
            "DeviceCuller: %zu objects exceed device capacity of %u", objects.size(), maxObjects);
    }

    DeviceCullPlan plan;
    plan.objects.reserve(objects.size());

    std::unordered_map<uint64_t, uint32_t> batchLookup;
    for (uint32_t i = 0; i < objects.size(); ++i) {
        const SceneObject& object = objects[i];

        const MeshRange* mesh = meshes.find(object.mesh);
        if (!mesh) {
            CullingErrors::fail<UnresolvedHandleError>(
                "DeviceCuller: object %u references unknown mesh %u", i, object.mesh);
        }
        const MaterialManager::MaterialEntry* material = materials.find(object.material);
        if (!material) {
            CullingErrors::fail<UnresolvedHandleError>(
                "DeviceCuller: object %u references unknown material %u", i, object.material);
        }

        uint64_t key = (static_cast<uint64_t>(object.mesh) << 32) | object.material;
        auto [it, inserted] = batchLookup.try_emplace(key, static_cast<uint32_t>(plan.commands.size()));
        if (inserted) {
            GPUDrawIndexedIndirectCommand command{};
            command.indexCount = mesh->indexCount;
            command.instanceCount = 0;
            command.firstIndex = mesh->firstIndex;
            command.vertexOffset = mesh->vertexOffset;
            // firstInstance temporarily counts the batch's objects
            command.firstInstance = 0;
            plan.commands.push_back(command);
        }
        plan.commands[it->second].firstInstance++;

        GPUCullObject cullObject{};
        cullObject.model = object.transform;
        cullObject.localSphere = mesh->localBounds.packed();
        cullObject.batchIndex = it->second;
        cullObject.materialIndex = material->deviceIndex;
        plan.objects.push_back(cullObject);
    }

    // Turn per-batch object counts into range bases
    uint32_t base = 0;
    for (GPUDrawIndexedIndirectCommand& command : plan.commands) {
        uint32_t count = command.firstInstance;
        command.firstInstance = base;
        base += count;
    }

    return plan;
}

OpaqueCullUniforms makeCullUniforms(const CameraSnapshot& camera,
                                    uint32_t objectCount, uint32_t batchCount) {
    OpaqueCullUniforms uniforms{};
    uniforms.viewMatrix = camera.view;
    uniforms.projMatrix = camera.projection;
    uniforms.viewProjMatrix = camera.viewProj();
    uniforms.cameraPosition = glm::vec4(camera.position(), 1.0f);
    uniforms.objectCount = objectCount;
    uniforms.batchCount = batchCount;

    Frustum frustum = Frustum::fromViewProj(uniforms.viewProjMatrix);
    for (size_t i = 0; i < frustum.planes.size(); ++i) {
        uniforms.frustumPlanes[i] = frustum.planes[i];
    }
    return uniforms;
}

// ============================================================================
// DeviceCuller
// ============================================================================

std::unique_ptr<DeviceCuller> DeviceCuller::create(const InitInfo& info) {
    auto culler = std::make_unique<DeviceCuller>(ConstructToken{});
    if (!culler->initInternal(info)) {
        return nullptr;
    }
    return culler;
}

bool DeviceCuller::initInternal(const InitInfo& info) {
    if (!info.raiiDevice || !info.descriptorPool || !info.interfaces) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "DeviceCuller requires raiiDevice, descriptorPool and interfaces");
        return false;
    }
    if (info.maxObjects == 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "DeviceCuller: maxObjects must be positive");
        return false;
    }

    device_ = static_cast<VkDevice>(**info.raiiDevice);
    allocator_ = info.allocator;
    interfaces_ = info.interfaces;
    maxObjects_ = info.maxObjects;
    enableReadback_ = info.enableReadback;

    if (!createPipeline(*info.raiiDevice, info.shaderPath)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "DeviceCuller: Failed to create pipeline");
        return false;
    }

    std::vector<VkDescriptorSet> computeSets =
        info.descriptorPool->allocate(interfaces_->getDeviceCullComputeLayout(), info.framesInFlight);
    std::vector<VkDescriptorSet> outputSets =
        info.descriptorPool->allocate(interfaces_->getDeviceCullOutputLayout(), info.framesInFlight);
    if (computeSets.size() != info.framesInFlight || outputSets.size() != info.framesInFlight) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "DeviceCuller: Failed to allocate descriptor sets");
        return false;
    }

    bool ok = true;
    frames_.resize(info.framesInFlight, [&](uint32_t i) {
        FrameResources frame;
        frame.computeSet = computeSets[i];
        frame.outputSet = outputSets[i];
        ok = ok && createFrameBuffers(frame);
        return frame;
    });
    if (!ok) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "DeviceCuller: Failed to create frame buffers");
        return false;
    }

    for (const FrameResources& frame : frames_) {
        writeDescriptorSets(frame);
    }

    SDL_Log("DeviceCuller: Initialized with %u frames, capacity %u objects",
            info.framesInFlight, maxObjects_);
    return true;
}

bool DeviceCuller::createPipeline(const vk::raii::Device& device, const std::string& shaderPath) {
    return ComputePipelineBuilder(device)
        .setShader(shaderPath + "/opaque_cull.comp.spv")
        .addDescriptorSetLayout(interfaces_->getDeviceCullComputeLayout())
        .buildInto(pipelineLayout_, pipeline_);
}

bool DeviceCuller::createFrameBuffers(FrameResources& frame) const {
    const vk::DeviceSize commandBytes = static_cast<vk::DeviceSize>(maxObjects_) * sizeof(GPUDrawIndexedIndirectCommand);

    bool ok = BufferBuilder(allocator_)
        .setSize(sizeof(OpaqueCullUniforms)).asUniform().hostVisible()
        .build(frame.cullUniforms);
    ok = ok && BufferBuilder(allocator_)
        .setSize(sizeof(CullOutputUniforms)).asUniform().hostVisible()
        .build(frame.outputUniforms);
    ok = ok && BufferBuilder(allocator_)
        .setSize(static_cast<vk::DeviceSize>(maxObjects_) * sizeof(GPUCullObject))
        .asStorage().hostVisible()
        .build(frame.objects);
    ok = ok && BufferBuilder(allocator_)
        .setSize(commandBytes).asTransferSrc().hostVisible()
        .build(frame.commandTemplates);
    ok = ok && BufferBuilder(allocator_)
        .setSize(static_cast<vk::DeviceSize>(maxObjects_) * sizeof(uint32_t))
        .asStorage().deviceLocal()
        .build(frame.visible);
    if (!ok) {
        return false;
    }

    BufferBuilder indirect(allocator_);
    indirect.setSize(commandBytes).asStorage().asIndirect().asTransferDst();
    if (enableReadback_) {
        indirect.hostReadable();
    } else {
        indirect.deviceLocal();
    }
    return indirect.build(frame.indirect);
}

void DeviceCuller::writeDescriptorSets(const FrameResources& frame) const {
    DescriptorManager::SetWriter(device_, frame.computeSet)
        .writeUniform(BINDING_OPAQUE_CULL_UNIFORMS, frame.cullUniforms.get(), sizeof(OpaqueCullUniforms))
        .writeStorage(BINDING_OPAQUE_CULL_OBJECTS, frame.objects.get())
        .writeStorage(BINDING_OPAQUE_CULL_INDIRECT, frame.indirect.get())
        .writeStorage(BINDING_OPAQUE_CULL_VISIBLE, frame.visible.get())
        .update();

    DescriptorManager::SetWriter(device_, frame.outputSet)
        .writeUniform(BINDING_CULL_OUTPUT_UNIFORMS, frame.outputUniforms.get(), sizeof(CullOutputUniforms))
        .writeStorage(BINDING_CULL_OUTPUT_OBJECTS, frame.objects.get())
        .writeStorage(BINDING_CULL_OUTPUT_VISIBLE, frame.visible.get())
        .update();
}

CulledObjectSet DeviceCuller::cull(const DeviceCullArgs& args) {
    // Raises before anything is uploaded or recorded
    DeviceCullPlan plan = buildDeviceCullPlan(args.objects, args.meshes, args.materials, maxObjects_);

    FrameResources& frame = frames_.at(args.frameIndex);
    const uint32_t objectCount = static_cast<uint32_t>(plan.objects.size());
    const uint32_t batchCount = static_cast<uint32_t>(plan.commands.size());
    frame.batchCount = batchCount;

    OpaqueCullUniforms cullUniforms = makeCullUniforms(args.camera, objectCount, batchCount);
    std::memcpy(frame.cullUniforms.mappedData(), &cullUniforms, sizeof(cullUniforms));
    frame.cullUniforms.flush();

    CullOutputUniforms outputUniforms{};
    outputUniforms.viewMatrix = cullUniforms.viewMatrix;
    outputUniforms.projMatrix = cullUniforms.projMatrix;
    outputUniforms.viewProjMatrix = cullUniforms.viewProjMatrix;
    outputUniforms.cameraPosition = cullUniforms.cameraPosition;
    std::memcpy(frame.outputUniforms.mappedData(), &outputUniforms, sizeof(outputUniforms));
    frame.outputUniforms.flush();

    DeviceDrawData drawData{};
    drawData.indirectBuffer = frame.indirect.get();
    drawData.offset = 0;
    drawData.drawCount = batchCount;
    drawData.stride = sizeof(GPUDrawIndexedIndirectCommand);

    if (objectCount == 0) {
        // Zero-sized copies are invalid, and there is nothing to draw
        return CulledObjectSet{CulledCalls::device(drawData), frame.outputSet, args.frameIndex};
    }

    const vk::DeviceSize commandBytes = batchCount * sizeof(GPUDrawIndexedIndirectCommand);
    std::memcpy(frame.objects.mappedData(), plan.objects.data(), objectCount * sizeof(GPUCullObject));
    frame.objects.flush(0, objectCount * sizeof(GPUCullObject));
    std::memcpy(frame.commandTemplates.mappedData(), plan.commands.data(), commandBytes);
    frame.commandTemplates.flush(0, commandBytes);

    ICommandEncoder& encoder = args.encoder;
    encoder.copyBuffer(frame.commandTemplates.get(), frame.indirect.get(), commandBytes);
    encoder.barrier(EncoderBarrier::TransferToCompute);
    encoder.bindComputePipeline(static_cast<VkPipeline>(**pipeline_));
    encoder.bindComputeDescriptorSet(static_cast<VkPipelineLayout>(**pipelineLayout_), 0, frame.computeSet);
    encoder.dispatch((objectCount + WORKGROUP_SIZE - 1) / WORKGROUP_SIZE, 1, 1);
    encoder.barrier(EncoderBarrier::ComputeToIndirectDraw);

    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "DeviceCuller: frame %u: %u objects, %u batches",
                 args.frameIndex, objectCount, batchCount);

    return CulledObjectSet{CulledCalls::device(drawData), frame.outputSet, args.frameIndex};
}

std::vector<GPUDrawIndexedIndirectCommand> DeviceCuller::readbackCommands(uint32_t frameIndex) const {
    if (!enableReadback_) {
        CullingErrors::fail<ContractViolation>(
            "DeviceCuller: readbackCommands requires enableReadback");
    }

    const FrameResources& frame = frames_.at(frameIndex);
    std::vector<GPUDrawIndexedIndirectCommand> commands(frame.batchCount);
    if (frame.batchCount == 0) {
        return commands;
    }

    const vk::DeviceSize bytes = frame.batchCount * sizeof(GPUDrawIndexedIndirectCommand);
    frame.indirect.invalidate(0, bytes);
    std::memcpy(commands.data(), frame.indirect.mappedData(), bytes);
    return commands;
}
