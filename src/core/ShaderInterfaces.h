#pragma once

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <glm/glm.hpp>
#include <memory>
#include <optional>

// Per-frame camera block at BINDING_CULL_OUTPUT_UNIFORMS of the cull output set.
// Written by both cullers so the opaque vertex shaders see the same layout.
struct CullOutputUniforms {
    glm::mat4 viewMatrix;
    glm::mat4 projMatrix;
    glm::mat4 viewProjMatrix;
    glm::vec4 cameraPosition;       // xyz = position, w = unused
};
static_assert(sizeof(CullOutputUniforms) == 208, "CullOutputUniforms must match std140 layout");

/**
 * ShaderInterfaces - Descriptor set layouts shared by the cullers and pipelines
 *
 * Created once at startup and shared read-only. The graphics pipelines of the
 * opaque pass are built against these same layouts (slot 0 = sampler set,
 * slot 1 = cull output set for the active strategy).
 */
class ShaderInterfaces {
public:
    struct ConstructToken { explicit ConstructToken() = default; };
    explicit ShaderInterfaces(ConstructToken) {}

    static std::shared_ptr<const ShaderInterfaces> create(const vk::raii::Device& device);

    vk::DescriptorSetLayout getSamplerLayout() const { return **samplerLayout_; }
    vk::DescriptorSetLayout getHostCullOutputLayout() const { return **hostCullOutputLayout_; }
    vk::DescriptorSetLayout getDeviceCullOutputLayout() const { return **deviceCullOutputLayout_; }
    vk::DescriptorSetLayout getDeviceCullComputeLayout() const { return **deviceCullComputeLayout_; }

private:
    bool initInternal(const vk::raii::Device& device);

    std::optional<vk::raii::DescriptorSetLayout> samplerLayout_;
    std::optional<vk::raii::DescriptorSetLayout> hostCullOutputLayout_;
    std::optional<vk::raii::DescriptorSetLayout> deviceCullOutputLayout_;
    std::optional<vk::raii::DescriptorSetLayout> deviceCullComputeLayout_;
};
