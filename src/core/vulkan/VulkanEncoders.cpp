#include "VulkanEncoders.h"
#include "BarrierHelpers.h"
#include "core/CullingErrors.h"
#include "core/pipeline/GraphicsPipeline.h"

// ============================================================================
// VulkanCommandEncoder
// ============================================================================

void VulkanCommandEncoder::copyBuffer(VkBuffer src, VkBuffer dst, VkDeviceSize size) {
    auto region = vk::BufferCopy{}
        .setSrcOffset(0)
        .setDstOffset(0)
        .setSize(size);
    cmd_.copyBuffer(vk::Buffer(src), vk::Buffer(dst), region);
}

void VulkanCommandEncoder::barrier(EncoderBarrier barrier) {
    switch (barrier) {
        case EncoderBarrier::TransferToCompute:
            BarrierHelpers::transferToCompute(cmd_);
            break;
        case EncoderBarrier::ComputeToIndirectDraw:
            BarrierHelpers::computeToIndirectDraw(cmd_);
            break;
    }
}

void VulkanCommandEncoder::bindComputePipeline(VkPipeline pipeline) {
    cmd_.bindPipeline(vk::PipelineBindPoint::eCompute, vk::Pipeline(pipeline));
}

void VulkanCommandEncoder::bindComputeDescriptorSet(VkPipelineLayout layout, uint32_t slot, VkDescriptorSet set) {
    cmd_.bindDescriptorSets(vk::PipelineBindPoint::eCompute,
                            vk::PipelineLayout(layout), slot, vk::DescriptorSet(set), {});
}

void VulkanCommandEncoder::dispatch(uint32_t groupCountX, uint32_t groupCountY, uint32_t groupCountZ) {
    cmd_.dispatch(groupCountX, groupCountY, groupCountZ);
}

// ============================================================================
// VulkanRenderPassEncoder
// ============================================================================

void VulkanRenderPassEncoder::setPipeline(const GraphicsPipeline& pipeline) {
    cmd_.bindPipeline(vk::PipelineBindPoint::eGraphics, vk::Pipeline(pipeline.pipeline));
    currentLayout_ = vk::PipelineLayout(pipeline.layout);
}

void VulkanRenderPassEncoder::setBindGroup(uint32_t slot, VkDescriptorSet set) {
    if (!currentLayout_) {
        CullingErrors::fail<ContractViolation>(
            "VulkanRenderPassEncoder: descriptor set bound at slot %u before any pipeline", slot);
    }
    cmd_.bindDescriptorSets(vk::PipelineBindPoint::eGraphics,
                            currentLayout_, slot, vk::DescriptorSet(set), {});
}

void VulkanRenderPassEncoder::setVertexBuffer(VkBuffer buffer) {
    vk::Buffer vertexBuffers[] = {vk::Buffer(buffer)};
    vk::DeviceSize offsets[] = {0};
    cmd_.bindVertexBuffers(0, vertexBuffers, offsets);
}

void VulkanRenderPassEncoder::setIndexBuffer(VkBuffer buffer) {
    cmd_.bindIndexBuffer(vk::Buffer(buffer), 0, vk::IndexType::eUint32);
}

void VulkanRenderPassEncoder::drawIndexed(uint32_t indexCount, uint32_t instanceCount,
                                          uint32_t firstIndex, int32_t vertexOffset,
                                          uint32_t firstInstance) {
    cmd_.drawIndexed(indexCount, instanceCount, firstIndex, vertexOffset, firstInstance);
}

void VulkanRenderPassEncoder::drawIndexedIndirect(VkBuffer buffer, VkDeviceSize offset,
                                                  uint32_t drawCount, uint32_t stride) {
    cmd_.drawIndexedIndirect(vk::Buffer(buffer), offset, drawCount, stride);
}
