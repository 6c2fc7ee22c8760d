#pragma once

#include "RenderMode.h"

#include <cstdint>
#include <optional>
#include <string>

/**
 * RendererConfig - Construction-time settings for the culling/draw core
 *
 * The strategy is read once when the Culler is created and is immutable for
 * the renderer's lifetime.
 *
 * JSON form (all keys optional):
 *   {
 *     "strategy": "device",
 *     "framesInFlight": 2,
 *     "maxDeviceObjects": 8192,
 *     "initialHostInstances": 1024,
 *     "shaderPath": "shaders",
 *     "enableReadback": false
 *   }
 */
struct RendererConfig {
    static constexpr uint32_t MAX_FRAMES_IN_FLIGHT = 4;

    CullingStrategy strategy = CullingStrategy::Host;
    uint32_t framesInFlight = 2;
    uint32_t maxDeviceObjects = 8192;
    uint32_t initialHostInstances = 1024;
    std::string shaderPath = "shaders";
    bool enableReadback = false;

    // Returns false (and logs) when a field is out of range
    bool validate() const;

    static std::optional<RendererConfig> loadFromJson(const std::string& jsonPath);
    static std::optional<RendererConfig> loadFromJsonString(const std::string& jsonString);
};
