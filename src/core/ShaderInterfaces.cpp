#include "ShaderInterfaces.h"
#include "DescriptorManager.h"
#include "shaders/bindings.h"
#include <SDL3/SDL_log.h>

namespace {

constexpr VkShaderStageFlags DRAW_STAGES = VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT;

bool adoptLayout(const vk::raii::Device& device, VkDescriptorSetLayout rawLayout,
                 std::optional<vk::raii::DescriptorSetLayout>& out, const char* name) {
    if (rawLayout == VK_NULL_HANDLE) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ShaderInterfaces: Failed to create %s layout", name);
        return false;
    }
    out.emplace(device, rawLayout);
    return true;
}

} // namespace

std::shared_ptr<const ShaderInterfaces> ShaderInterfaces::create(const vk::raii::Device& device) {
    auto interfaces = std::make_shared<ShaderInterfaces>(ConstructToken{});
    if (!interfaces->initInternal(device)) {
        return nullptr;
    }
    return interfaces;
}

bool ShaderInterfaces::initInternal(const vk::raii::Device& device) {
    VkDevice rawDevice = *device;

    VkDescriptorSetLayout samplers = DescriptorManager::LayoutBuilder(rawDevice)
        .addSampler(BINDING_SAMPLER_LINEAR, VK_SHADER_STAGE_FRAGMENT_BIT)
        .addSampler(BINDING_SAMPLER_NEAREST, VK_SHADER_STAGE_FRAGMENT_BIT)
        .build();
    if (!adoptLayout(device, samplers, samplerLayout_, "sampler")) {
        return false;
    }

    // Host strategy: instances are already in batch-range order
    VkDescriptorSetLayout hostOutput = DescriptorManager::LayoutBuilder(rawDevice)
        .addUniformBuffer(BINDING_CULL_OUTPUT_UNIFORMS, DRAW_STAGES)
        .addStorageBuffer(BINDING_CULL_OUTPUT_INSTANCES, DRAW_STAGES)
        .build();
    if (!adoptLayout(device, hostOutput, hostCullOutputLayout_, "host cull output")) {
        return false;
    }

    // Device strategy: gl_InstanceIndex -> visible index -> object
    VkDescriptorSetLayout deviceOutput = DescriptorManager::LayoutBuilder(rawDevice)
        .addUniformBuffer(BINDING_CULL_OUTPUT_UNIFORMS, DRAW_STAGES)
        .addStorageBuffer(BINDING_CULL_OUTPUT_OBJECTS, DRAW_STAGES)
        .addStorageBuffer(BINDING_CULL_OUTPUT_VISIBLE, DRAW_STAGES)
        .build();
    if (!adoptLayout(device, deviceOutput, deviceCullOutputLayout_, "device cull output")) {
        return false;
    }

    VkDescriptorSetLayout deviceCompute = DescriptorManager::LayoutBuilder(rawDevice)
        .addUniformBuffer(BINDING_OPAQUE_CULL_UNIFORMS, VK_SHADER_STAGE_COMPUTE_BIT)
        .addStorageBuffer(BINDING_OPAQUE_CULL_OBJECTS, VK_SHADER_STAGE_COMPUTE_BIT)
        .addStorageBuffer(BINDING_OPAQUE_CULL_INDIRECT, VK_SHADER_STAGE_COMPUTE_BIT)
        .addStorageBuffer(BINDING_OPAQUE_CULL_VISIBLE, VK_SHADER_STAGE_COMPUTE_BIT)
        .build();
    if (!adoptLayout(device, deviceCompute, deviceCullComputeLayout_, "device cull compute")) {
        return false;
    }

    SDL_Log("ShaderInterfaces: Created 4 descriptor set layouts");
    return true;
}
