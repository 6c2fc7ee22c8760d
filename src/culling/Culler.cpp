#include "Culler.h"
#include <SDL3/SDL_log.h>

std::unique_ptr<Culler> Culler::create(const InitInfo& info, const RendererConfig& config) {
    if (!config.validate()) {
        return nullptr;
    }

    if (config.strategy == CullingStrategy::Host) {
        HostCuller::InitInfo hostInfo{};
        hostInfo.raiiDevice = info.raiiDevice;
        hostInfo.allocator = info.allocator;
        hostInfo.descriptorPool = info.descriptorPool;
        hostInfo.interfaces = info.interfaces;
        hostInfo.framesInFlight = config.framesInFlight;
        hostInfo.initialInstanceCapacity = config.initialHostInstances;

        auto host = HostCuller::create(hostInfo);
        if (!host) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Culler: Failed to create host culler");
            return nullptr;
        }
        return std::make_unique<Culler>(ConstructToken{}, CullerStorage::host(std::move(host)));
    }

    DeviceCuller::InitInfo deviceInfo{};
    deviceInfo.raiiDevice = info.raiiDevice;
    deviceInfo.allocator = info.allocator;
    deviceInfo.descriptorPool = info.descriptorPool;
    deviceInfo.interfaces = info.interfaces;
    deviceInfo.shaderPath = config.shaderPath;
    deviceInfo.framesInFlight = config.framesInFlight;
    deviceInfo.maxObjects = config.maxDeviceObjects;
    deviceInfo.enableReadback = config.enableReadback;

    auto device = DeviceCuller::create(deviceInfo);
    if (!device) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Culler: Failed to create device culler");
        return nullptr;
    }
    return std::make_unique<Culler>(ConstructToken{}, CullerStorage::device(std::move(device)));
}
