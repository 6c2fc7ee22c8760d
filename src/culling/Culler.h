#pragma once

#include "HostCuller.h"
#include "DeviceCuller.h"
#include "core/RenderMode.h"
#include "core/RendererConfig.h"

#include <memory>

using CullerStorage = ModeData<std::unique_ptr<HostCuller>, std::unique_ptr<DeviceCuller>>;
using CullerRef = ModeData<HostCuller*, DeviceCuller*>;

/**
 * Culler - Owns the culler for the strategy chosen in RendererConfig
 *
 * The strategy is fixed at creation. Passes receive a non-owning CullerRef
 * and branch on it once per call.
 */
class Culler {
public:
    struct ConstructToken { explicit ConstructToken() = default; };
    Culler(ConstructToken, CullerStorage storage) : storage_(std::move(storage)) {}

    struct InitInfo {
        const vk::raii::Device* raiiDevice = nullptr;
        VmaAllocator allocator = VK_NULL_HANDLE;
        DescriptorManager::Pool* descriptorPool = nullptr;
        std::shared_ptr<const ShaderInterfaces> interfaces;
    };

    static std::unique_ptr<Culler> create(const InitInfo& info, const RendererConfig& config);

    CullingStrategy strategy() const { return storage_.strategy(); }

    CullerRef ref() {
        return storage_.map(
            [](const std::unique_ptr<HostCuller>& host) { return host.get(); },
            [](const std::unique_ptr<DeviceCuller>& device) { return device.get(); });
    }

private:
    CullerStorage storage_;
};
