#include "ShaderLoader.h"
#include <SDL3/SDL_log.h>
#include <fstream>

namespace ShaderLoader {

std::optional<std::vector<uint32_t>> readSpirv(const std::string& path) {
    std::ifstream file(path, std::ios::ate | std::ios::binary);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ShaderLoader: Failed to open %s", path.c_str());
        return std::nullopt;
    }

    size_t fileSize = static_cast<size_t>(file.tellg());
    if (fileSize == 0 || fileSize % sizeof(uint32_t) != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "ShaderLoader: %s is not SPIR-V (%zu bytes)", path.c_str(), fileSize);
        return std::nullopt;
    }

    std::vector<uint32_t> words(fileSize / sizeof(uint32_t));
    file.seekg(0);
    file.read(reinterpret_cast<char*>(words.data()), static_cast<std::streamsize>(fileSize));
    return words;
}

std::optional<vk::raii::ShaderModule> loadShaderModule(const vk::raii::Device& device,
                                                      const std::string& path) {
    auto code = readSpirv(path);
    if (!code) {
        return std::nullopt;
    }

    auto createInfo = vk::ShaderModuleCreateInfo{}.setCode(*code);
    try {
        return vk::raii::ShaderModule(device, createInfo);
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "ShaderLoader: Failed to create module for %s: %s", path.c_str(), e.what());
        return std::nullopt;
    }
}

}
