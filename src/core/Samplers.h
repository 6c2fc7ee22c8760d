#pragma once

#include "DescriptorManager.h"

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <memory>
#include <optional>

class ShaderInterfaces;

/**
 * Samplers - The linear/nearest sampler pair every opaque material samples with
 *
 * Bound at slot 0 of both the depth prepass and the opaque pipeline.
 * Immutable after creation.
 */
class Samplers {
public:
    struct ConstructToken { explicit ConstructToken() = default; };
    explicit Samplers(ConstructToken) {}

    static std::shared_ptr<const Samplers> create(const vk::raii::Device& device,
                                                  const ShaderInterfaces& interfaces,
                                                  DescriptorManager::Pool& pool);

    VkDescriptorSet getBindGroup() const { return bindGroup_; }
    vk::Sampler getLinear() const { return **linear_; }
    vk::Sampler getNearest() const { return **nearest_; }

private:
    bool initInternal(const vk::raii::Device& device, const ShaderInterfaces& interfaces,
                      DescriptorManager::Pool& pool);

    std::optional<vk::raii::Sampler> linear_;
    std::optional<vk::raii::Sampler> nearest_;
    VkDescriptorSet bindGroup_ = VK_NULL_HANDLE;
};
