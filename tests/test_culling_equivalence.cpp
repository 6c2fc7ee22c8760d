#include <doctest/doctest.h>

#include "TestScene.h"
#include "culling/DeviceCuller.h"
#include "culling/HostCuller.h"

#include <algorithm>

namespace {

// Line-for-line port of main() in opaque_cull.comp, run over the buffers the
// device culler uploads. Slot order within a batch follows object order here;
// on a GPU it depends on atomic ordering, so comparisons use sorted ranges.
struct EmulatedDeviceResult {
    std::vector<GPUDrawIndexedIndirectCommand> commands;
    std::vector<uint32_t> visibleIndices;
};

EmulatedDeviceResult runCullShader(const DeviceCullPlan& plan, const OpaqueCullUniforms& cull) {
    EmulatedDeviceResult result;
    result.commands = plan.commands;
    result.visibleIndices.assign(plan.objects.size(), ~0u);

    for (uint32_t objectIndex = 0; objectIndex < cull.objectCount; ++objectIndex) {
        const GPUCullObject& obj = plan.objects[objectIndex];

        glm::vec3 center = glm::vec3(obj.model * glm::vec4(glm::vec3(obj.localSphere), 1.0f));
        float scale = std::max(glm::length(glm::vec3(obj.model[0])),
                      std::max(glm::length(glm::vec3(obj.model[1])), glm::length(glm::vec3(obj.model[2]))));
        float radius = obj.localSphere.w * scale;

        bool inside = true;
        for (int i = 0; i < 6; ++i) {
            if (glm::dot(glm::vec3(cull.frustumPlanes[i]), center) + cull.frustumPlanes[i].w < -radius) {
                inside = false;
                break;
            }
        }
        if (!inside) {
            continue;
        }

        GPUDrawIndexedIndirectCommand& command = result.commands[obj.batchIndex];
        uint32_t slot = command.instanceCount++;
        result.visibleIndices[command.firstInstance + slot] = objectIndex;
    }
    return result;
}

// Pseudo-random scene spread around the camera, reproducible across runs
std::vector<SceneObject> makeScatteredScene(const TestScene& scene, uint32_t count) {
    uint32_t state = 12345u;
    auto next = [&state]() {
        state = state * 1664525u + 1013904223u;
        return static_cast<float>(state >> 8) / static_cast<float>(1u << 24);
    };

    const MeshHandle meshes[] = {scene.cube, scene.sphere};
    const MaterialHandle materials[] = {scene.stone, scene.metal};

    std::vector<SceneObject> objects;
    for (uint32_t i = 0; i < count; ++i) {
        glm::vec3 position(next() * 80.0f - 40.0f, next() * 20.0f - 10.0f, next() * 140.0f - 120.0f);
        float scale = 0.25f + next() * 3.0f;
        objects.push_back(makeObject(meshes[i % 2], materials[(i / 3) % 2], position, scale));
    }
    return objects;
}

void checkEquivalent(const TestScene& scene, const std::vector<SceneObject>& objects) {
    CameraSnapshot camera = makeTestCamera();

    Frustum frustum = Frustum::fromViewProj(camera.viewProj());
    HostBatches host = buildHostBatches(frustum, objects, scene.meshes, scene.materials);

    DeviceCullPlan plan = buildDeviceCullPlan(objects, scene.meshes, scene.materials, 8192);
    OpaqueCullUniforms uniforms = makeCullUniforms(camera,
        static_cast<uint32_t>(plan.objects.size()), static_cast<uint32_t>(plan.commands.size()));
    EmulatedDeviceResult device = runCullShader(plan, uniforms);

    // Batches that drew nothing on the device have no host counterpart
    std::vector<GPUDrawIndexedIndirectCommand> drawn;
    for (const auto& command : device.commands) {
        if (command.instanceCount > 0) {
            drawn.push_back(command);
        }
    }
    REQUIRE(drawn.size() == host.calls.size());

    for (size_t b = 0; b < drawn.size(); ++b) {
        const HostDrawCall& hostCall = host.calls[b];
        const GPUDrawIndexedIndirectCommand& command = drawn[b];
        const MeshRange* mesh = scene.meshes.find(hostCall.mesh);

        CHECK(command.instanceCount == hostCall.instanceCount);
        CHECK(command.indexCount == mesh->indexCount);
        CHECK(command.firstIndex == mesh->firstIndex);
        CHECK(command.vertexOffset == mesh->vertexOffset);

        std::vector<uint32_t> hostObjects(host.instanceObjects.begin() + hostCall.firstInstance,
                                          host.instanceObjects.begin() + hostCall.firstInstance + hostCall.instanceCount);
        std::vector<uint32_t> deviceObjects(device.visibleIndices.begin() + command.firstInstance,
                                            device.visibleIndices.begin() + command.firstInstance + command.instanceCount);
        std::sort(hostObjects.begin(), hostObjects.end());
        std::sort(deviceObjects.begin(), deviceObjects.end());
        CHECK(hostObjects == deviceObjects);

        for (uint32_t objectIndex : deviceObjects) {
            CHECK(objects[objectIndex].mesh == hostCall.mesh);
            CHECK(objects[objectIndex].material == hostCall.material);
        }
    }
}

} // namespace

TEST_SUITE("CullingEquivalence") {
    TEST_CASE("three-object scenario matches") {
        TestScene scene;
        std::vector<SceneObject> objects = {
            makeObject(scene.cube, scene.stone, glm::vec3(-1.0f, 0.0f, -10.0f)),
            makeObject(scene.cube, scene.stone, glm::vec3(1.0f, 0.0f, -10.0f)),
            makeObject(scene.sphere, scene.metal, glm::vec3(0.0f, 0.0f, 20.0f)),
        };
        checkEquivalent(scene, objects);
    }

    TEST_CASE("scattered scene matches") {
        TestScene scene;
        checkEquivalent(scene, makeScatteredScene(scene, 500));
    }

    TEST_CASE("nothing visible matches") {
        TestScene scene;
        std::vector<SceneObject> objects = {
            makeObject(scene.cube, scene.stone, glm::vec3(0.0f, 0.0f, 10.0f)),
            makeObject(scene.sphere, scene.metal, glm::vec3(0.0f, 0.0f, 30.0f)),
        };
        checkEquivalent(scene, objects);
    }

    TEST_CASE("empty scene matches") {
        TestScene scene;
        checkEquivalent(scene, {});
    }
}
