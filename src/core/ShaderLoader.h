#pragma once

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ShaderLoader {

// SPIR-V words of a compiled shader; nullopt if missing or not word-aligned
std::optional<std::vector<uint32_t>> readSpirv(const std::string& path);

std::optional<vk::raii::ShaderModule> loadShaderModule(const vk::raii::Device& device,
                                                      const std::string& path);

}
