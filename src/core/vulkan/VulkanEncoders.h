#pragma once

// ============================================================================
// VulkanEncoders.h - vk::CommandBuffer implementations of the encoder seams
// ============================================================================

#include "core/interfaces/ICommandEncoder.h"
#include "core/interfaces/IRenderPassEncoder.h"

#include <vulkan/vulkan.hpp>

/**
 * Records compute/transfer work into a primary command buffer that is in the
 * recording state and outside any render pass.
 */
class VulkanCommandEncoder : public ICommandEncoder {
public:
    explicit VulkanCommandEncoder(vk::CommandBuffer cmd) : cmd_(cmd) {}

    void copyBuffer(VkBuffer src, VkBuffer dst, VkDeviceSize size) override;
    void barrier(EncoderBarrier barrier) override;

    void bindComputePipeline(VkPipeline pipeline) override;
    void bindComputeDescriptorSet(VkPipelineLayout layout, uint32_t slot, VkDescriptorSet set) override;
    void dispatch(uint32_t groupCountX, uint32_t groupCountY, uint32_t groupCountZ) override;

private:
    vk::CommandBuffer cmd_;
};

/**
 * Records draws into a command buffer inside an active render pass (or
 * dynamic rendering scope). Tracks the layout of the bound pipeline so
 * descriptor sets can be bound by slot alone.
 */
class VulkanRenderPassEncoder : public IRenderPassEncoder {
public:
    explicit VulkanRenderPassEncoder(vk::CommandBuffer cmd) : cmd_(cmd) {}

    void setPipeline(const GraphicsPipeline& pipeline) override;
    void setBindGroup(uint32_t slot, VkDescriptorSet set) override;

    void setVertexBuffer(VkBuffer buffer) override;
    void setIndexBuffer(VkBuffer buffer) override;

    void drawIndexed(uint32_t indexCount, uint32_t instanceCount,
                     uint32_t firstIndex, int32_t vertexOffset,
                     uint32_t firstInstance) override;

    void drawIndexedIndirect(VkBuffer buffer, VkDeviceSize offset,
                             uint32_t drawCount, uint32_t stride) override;

private:
    vk::CommandBuffer cmd_;
    vk::PipelineLayout currentLayout_;
};
