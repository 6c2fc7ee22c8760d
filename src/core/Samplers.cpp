#include "Samplers.h"
#include "ShaderInterfaces.h"
#include "shaders/bindings.h"
#include <SDL3/SDL_log.h>

namespace {

std::optional<vk::raii::Sampler> makeSampler(const vk::raii::Device& device, vk::Filter filter,
                                             vk::SamplerMipmapMode mipmapMode) {
    auto info = vk::SamplerCreateInfo{}
        .setMagFilter(filter)
        .setMinFilter(filter)
        .setMipmapMode(mipmapMode)
        .setAddressModeU(vk::SamplerAddressMode::eRepeat)
        .setAddressModeV(vk::SamplerAddressMode::eRepeat)
        .setAddressModeW(vk::SamplerAddressMode::eRepeat)
        .setMinLod(0.0f)
        .setMaxLod(VK_LOD_CLAMP_NONE);
    try {
        return vk::raii::Sampler(device, info);
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Samplers: Failed to create sampler: %s", e.what());
        return std::nullopt;
    }
}

} // namespace

std::shared_ptr<const Samplers> Samplers::create(const vk::raii::Device& device,
                                                 const ShaderInterfaces& interfaces,
                                                 DescriptorManager::Pool& pool) {
    auto samplers = std::make_shared<Samplers>(ConstructToken{});
    if (!samplers->initInternal(device, interfaces, pool)) {
        return nullptr;
    }
    return samplers;
}

bool Samplers::initInternal(const vk::raii::Device& device, const ShaderInterfaces& interfaces,
                            DescriptorManager::Pool& pool) {
    linear_ = makeSampler(device, vk::Filter::eLinear, vk::SamplerMipmapMode::eLinear);
    nearest_ = makeSampler(device, vk::Filter::eNearest, vk::SamplerMipmapMode::eNearest);
    if (!linear_ || !nearest_) {
        return false;
    }

    bindGroup_ = pool.allocateSingle(interfaces.getSamplerLayout());
    if (bindGroup_ == VK_NULL_HANDLE) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Samplers: Failed to allocate sampler set");
        return false;
    }

    DescriptorManager::SetWriter(*device, bindGroup_)
        .writeSampler(BINDING_SAMPLER_LINEAR, static_cast<VkSampler>(**linear_))
        .writeSampler(BINDING_SAMPLER_NEAREST, static_cast<VkSampler>(**nearest_))
        .update();
    return true;
}
