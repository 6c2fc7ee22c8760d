#include "HostCuller.h"
#include "core/CullingErrors.h"
#include "core/MeshBuffers.h"
#include "core/ShaderInterfaces.h"
#include "core/material/MaterialManager.h"
#include "shaders/bindings.h"

#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cstring>
#include <unordered_map>

namespace {

uint64_t batchKey(MeshHandle mesh, MaterialHandle material) {
    return (static_cast<uint64_t>(mesh) << 32) | material;
}

} // namespace

HostBatches buildHostBatches(const Frustum& frustum,
                             const std::vector<SceneObject>& objects,
                             const MeshBuffers& meshes,
                             const MaterialManager& materials) {
    HostBatches result;
    std::unordered_map<uint64_t, uint32_t> batchLookup;

    // Pass 1: visibility, batch discovery in first-seen order
    std::vector<uint32_t> survivorBatch(objects.size(), ~0u);
    for (uint32_t i = 0; i < objects.size(); ++i) {
        const SceneObject& object = objects[i];

        const MeshRange* mesh = meshes.find(object.mesh);
        if (!mesh) {
            CullingErrors::fail<UnresolvedHandleError>(
                "HostCuller: object %u references unknown mesh %u", i, object.mesh);
        }
        if (!materials.find(object.material)) {
            CullingErrors::fail<UnresolvedHandleError>(
                "HostCuller: object %u references unknown material %u", i, object.material);
        }

        if (!frustum.intersectsSphere(mesh->localBounds.transformed(object.transform))) {
            continue;
        }

        auto [it, inserted] = batchLookup.try_emplace(batchKey(object.mesh, object.material),
                                                      static_cast<uint32_t>(result.calls.size()));
        if (inserted) {
            result.calls.push_back({object.mesh, object.material, 0, 0});
        }
        result.calls[it->second].instanceCount++;
        survivorBatch[i] = it->second;
    }

    // Pass 2: contiguous ranges, packed in batch order
    uint32_t nextInstance = 0;
    for (HostDrawCall& call : result.calls) {
        call.firstInstance = nextInstance;
        nextInstance += call.instanceCount;
    }

    // Pass 3: scatter survivors into their ranges, preserving object order
    result.instanceObjects.resize(nextInstance);
    std::vector<uint32_t> cursor(result.calls.size(), 0);
    for (uint32_t i = 0; i < objects.size(); ++i) {
        uint32_t batch = survivorBatch[i];
        if (batch == ~0u) {
            continue;
        }
        result.instanceObjects[result.calls[batch].firstInstance + cursor[batch]++] = i;
    }

    return result;
}

std::vector<HostInstanceData> packInstances(const HostBatches& batches,
                                            const std::vector<SceneObject>& objects,
                                            const CameraSnapshot& camera,
                                            const MaterialManager& materials) {
    const glm::mat4 viewProj = camera.viewProj();

    std::vector<HostInstanceData> instances;
    instances.reserve(batches.instanceObjects.size());
    for (uint32_t objectIndex : batches.instanceObjects) {
        const SceneObject& object = objects[objectIndex];

        HostInstanceData data{};
        data.model = object.transform;
        data.modelView = camera.view * object.transform;
        data.modelViewProj = viewProj * object.transform;
        data.invTransModelView = glm::transpose(glm::inverse(data.modelView));
        data.materialIndex = materials.find(object.material)->deviceIndex;
        instances.push_back(data);
    }
    return instances;
}

// ============================================================================
// HostCuller
// ============================================================================

std::unique_ptr<HostCuller> HostCuller::create(const InitInfo& info) {
    auto culler = std::make_unique<HostCuller>(ConstructToken{});
    if (!culler->initInternal(info)) {
        return nullptr;
    }
    return culler;
}

bool HostCuller::initInternal(const InitInfo& info) {
    if (!info.raiiDevice || !info.descriptorPool || !info.interfaces) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "HostCuller requires raiiDevice, descriptorPool and interfaces");
        return false;
    }

    device_ = static_cast<VkDevice>(**info.raiiDevice);
    allocator_ = info.allocator;
    interfaces_ = info.interfaces;

    std::vector<VkDescriptorSet> sets =
        info.descriptorPool->allocate(interfaces_->getHostCullOutputLayout(), info.framesInFlight);
    if (sets.size() != info.framesInFlight) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "HostCuller: Failed to allocate output sets");
        return false;
    }

    bool ok = true;
    frames_.resize(info.framesInFlight, [&](uint32_t i) {
        FrameResources frame;
        frame.outputSet = sets[i];
        ok = ok && BufferBuilder(allocator_)
            .setSize(sizeof(CullOutputUniforms))
            .asUniform()
            .hostVisible()
            .build(frame.uniforms);
        ok = ok && createInstanceBuffer(frame, std::max(info.initialInstanceCapacity, 1u));
        return frame;
    });
    if (!ok) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "HostCuller: Failed to create frame buffers");
        return false;
    }

    for (const FrameResources& frame : frames_) {
        writeOutputSet(frame);
    }

    SDL_Log("HostCuller: Initialized with %u frames, %u initial instances",
            info.framesInFlight, info.initialInstanceCapacity);
    return true;
}

bool HostCuller::createInstanceBuffer(FrameResources& frame, uint32_t capacity) {
    VmaBuffer buffer;
    bool built = BufferBuilder(allocator_)
        .setSize(static_cast<vk::DeviceSize>(capacity) * sizeof(HostInstanceData))
        .asStorage()
        .hostVisible()
        .build(buffer);
    if (!built) {
        return false;
    }
    frame.instances = std::move(buffer);
    frame.capacity = capacity;
    return true;
}

void HostCuller::writeOutputSet(const FrameResources& frame) {
    DescriptorManager::SetWriter(device_, frame.outputSet)
        .writeUniform(BINDING_CULL_OUTPUT_UNIFORMS, frame.uniforms.get(), sizeof(CullOutputUniforms))
        .writeStorage(BINDING_CULL_OUTPUT_INSTANCES, frame.instances.get())
        .update();
}

void HostCuller::ensureCapacity(FrameResources& frame, uint32_t frameIndex, uint32_t instanceCount) {
    if (instanceCount <= frame.capacity) {
        return;
    }

    uint32_t newCapacity = frame.capacity;
    while (newCapacity < instanceCount) {
        newCapacity *= 2;
    }

    // This slot's previous frame has completed, so its buffer can be replaced
    if (!createInstanceBuffer(frame, newCapacity)) {
        CullingErrors::fail<ResourceError>(
            "HostCuller: Failed to grow instance buffer to %u for frame %u", newCapacity, frameIndex);
    }
    writeOutputSet(frame);
    SDL_Log("HostCuller: Instance buffer for frame slot %u grown to %u",
            frames_.wrapIndex(frameIndex), newCapacity);
}

CulledObjectSet HostCuller::cull(const HostCullArgs& args) {
    Frustum frustum = Frustum::fromViewProj(args.camera.viewProj());
    HostBatches batches = buildHostBatches(frustum, args.objects, args.meshes, args.materials);

    FrameResources& frame = frames_.at(args.frameIndex);
    uint32_t instanceCount = static_cast<uint32_t>(batches.instanceObjects.size());
    ensureCapacity(frame, args.frameIndex, instanceCount);

    CullOutputUniforms uniforms{};
    uniforms.viewMatrix = args.camera.view;
    uniforms.projMatrix = args.camera.projection;
    uniforms.viewProjMatrix = args.camera.viewProj();
    uniforms.cameraPosition = glm::vec4(args.camera.position(), 1.0f);
    std::memcpy(frame.uniforms.mappedData(), &uniforms, sizeof(uniforms));
    frame.uniforms.flush();

    if (instanceCount > 0) {
        std::vector<HostInstanceData> instances =
            packInstances(batches, args.objects, args.camera, args.materials);
        std::memcpy(frame.instances.mappedData(), instances.data(),
                    instances.size() * sizeof(HostInstanceData));
        frame.instances.flush(0, instances.size() * sizeof(HostInstanceData));
    }

    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "HostCuller: frame %u: %zu objects, %u visible, %zu batches",
                 args.frameIndex, args.objects.size(), instanceCount, batches.calls.size());

    return CulledObjectSet{
        CulledCalls::host(std::move(batches.calls)),
        frame.outputSet,
        args.frameIndex
    };
}
