#pragma once

#include <vulkan/vulkan.h>

/**
 * GraphicsPipeline - A pre-compiled pipeline and the layout its sets bind against
 *
 * Created by the pipeline compilation subsystem and shared read-only
 * (std::shared_ptr<const GraphicsPipeline>) by every frame; the owner destroys
 * the Vulkan objects once the last frame using them has retired.
 */
struct GraphicsPipeline {
    VkPipeline pipeline = VK_NULL_HANDLE;
    VkPipelineLayout layout = VK_NULL_HANDLE;
};
