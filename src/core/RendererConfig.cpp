#include "RendererConfig.h"
#include <nlohmann/json.hpp>
#include <SDL3/SDL_log.h>
#include <fstream>
#include <iterator>

using json = nlohmann::json;

bool RendererConfig::validate() const {
    if (framesInFlight == 0 || framesInFlight > MAX_FRAMES_IN_FLIGHT) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "RendererConfig: framesInFlight must be in [1, %u], got %u",
            MAX_FRAMES_IN_FLIGHT, framesInFlight);
        return false;
    }
    if (maxDeviceObjects == 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "RendererConfig: maxDeviceObjects must be non-zero");
        return false;
    }
    if (initialHostInstances == 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "RendererConfig: initialHostInstances must be non-zero");
        return false;
    }
    return true;
}

std::optional<RendererConfig> RendererConfig::loadFromJson(const std::string& jsonPath) {
    std::ifstream file(jsonPath);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "RendererConfig: Failed to open config file: %s", jsonPath.c_str());
        return std::nullopt;
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    return loadFromJsonString(content);
}

std::optional<RendererConfig> RendererConfig::loadFromJsonString(const std::string& jsonString) {
    RendererConfig config;

    try {
        json j = json::parse(jsonString);

        std::string strategyStr = j.value("strategy", "host");
        if (strategyStr == "host") {
            config.strategy = CullingStrategy::Host;
        } else if (strategyStr == "device") {
            config.strategy = CullingStrategy::Device;
        } else {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                "RendererConfig: Unknown culling strategy '%s'", strategyStr.c_str());
            return std::nullopt;
        }

        config.framesInFlight = j.value("framesInFlight", config.framesInFlight);
        config.maxDeviceObjects = j.value("maxDeviceObjects", config.maxDeviceObjects);
        config.initialHostInstances = j.value("initialHostInstances", config.initialHostInstances);
        config.shaderPath = j.value("shaderPath", config.shaderPath);
        config.enableReadback = j.value("enableReadback", config.enableReadback);
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "RendererConfig: Failed to parse JSON: %s", e.what());
        return std::nullopt;
    }

    if (!config.validate()) {
        return std::nullopt;
    }

    SDL_Log("RendererConfig: %s culling, %u frames in flight",
            toString(config.strategy), config.framesInFlight);
    return config;
}
