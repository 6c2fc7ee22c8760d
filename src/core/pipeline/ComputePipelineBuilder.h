#pragma once

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <optional>
#include <string>
#include <vector>
#include <SDL3/SDL_log.h>
#include "core/ShaderLoader.h"

/**
 * ComputePipelineBuilder - Fluent builder for a compute pipeline and its layout
 *
 * Usage:
 *   ComputePipelineBuilder(raiiDevice)
 *       .setShader(shaderPath + "/opaque_cull.comp.spv")
 *       .addDescriptorSetLayout(cullSetLayout)
 *       .buildInto(pipelineLayout_, pipeline_);
 *
 * The shader module only lives for the duration of buildInto().
 */
class ComputePipelineBuilder {
public:
    explicit ComputePipelineBuilder(const vk::raii::Device& device)
        : device_(&device) {}

    ComputePipelineBuilder& setShader(const std::string& path) {
        shaderPath_ = path;
        return *this;
    }

    // Set index = order of calls
    ComputePipelineBuilder& addDescriptorSetLayout(vk::DescriptorSetLayout layout) {
        setLayouts_.push_back(layout);
        return *this;
    }

    bool buildInto(std::optional<vk::raii::PipelineLayout>& outLayout,
                   std::optional<vk::raii::Pipeline>& outPipeline) const {
        auto module = ShaderLoader::loadShaderModule(*device_, shaderPath_);
        if (!module) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                "ComputePipelineBuilder: Failed to load shader: %s", shaderPath_.c_str());
            return false;
        }

        try {
            outLayout.emplace(*device_, vk::PipelineLayoutCreateInfo{}.setSetLayouts(setLayouts_));

            auto stageInfo = vk::PipelineShaderStageCreateInfo{}
                .setStage(vk::ShaderStageFlagBits::eCompute)
                .setModule(**module)
                .setPName("main");

            auto pipelineInfo = vk::ComputePipelineCreateInfo{}
                .setStage(stageInfo)
                .setLayout(**outLayout);

            outPipeline.emplace(*device_, nullptr, pipelineInfo);
        } catch (const vk::SystemError& e) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                "ComputePipelineBuilder: Failed to create pipeline for %s: %s",
                shaderPath_.c_str(), e.what());
            outPipeline.reset();
            outLayout.reset();
            return false;
        }
        return true;
    }

private:
    const vk::raii::Device* device_;
    std::string shaderPath_;
    std::vector<vk::DescriptorSetLayout> setLayouts_;
};
