#pragma once

// ============================================================================
// IRenderPassEncoder.h - Draw recording inside an active render pass
// ============================================================================
//
// Descriptor sets are bound by slot against the layout of the most recently
// set pipeline, so setPipeline() must come first.
// The Vulkan implementation is VulkanRenderPassEncoder; tests use a recording mock.
//

#include <vulkan/vulkan.h>
#include <cstdint>

struct GraphicsPipeline;

class IRenderPassEncoder {
public:
    virtual ~IRenderPassEncoder() = default;

    virtual void setPipeline(const GraphicsPipeline& pipeline) = 0;
    virtual void setBindGroup(uint32_t slot, VkDescriptorSet set) = 0;

    virtual void setVertexBuffer(VkBuffer buffer) = 0;
    virtual void setIndexBuffer(VkBuffer buffer) = 0;

    virtual void drawIndexed(uint32_t indexCount, uint32_t instanceCount,
                             uint32_t firstIndex, int32_t vertexOffset,
                             uint32_t firstInstance) = 0;

    virtual void drawIndexedIndirect(VkBuffer buffer, VkDeviceSize offset,
                                     uint32_t drawCount, uint32_t stride) = 0;
};
