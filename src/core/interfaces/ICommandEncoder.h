#pragma once

// ============================================================================
// ICommandEncoder.h - Append-only command stream for compute/transfer work
// ============================================================================
//
// The device culler records its visibility work through this interface.
// Append order is the only ordering mechanism: everything recorded here is
// executed before any draw recorded later into the same submission.
// The Vulkan implementation is VulkanCommandEncoder; tests use a recording mock.
//

#include <vulkan/vulkan.h>
#include <cstdint>

enum class EncoderBarrier {
    TransferToCompute,      // copy/fill results read or atomically updated by compute
    ComputeToIndirectDraw   // compute output consumed as indirect args and vertex-stage SSBOs
};

class ICommandEncoder {
public:
    virtual ~ICommandEncoder() = default;

    virtual void copyBuffer(VkBuffer src, VkBuffer dst, VkDeviceSize size) = 0;
    virtual void barrier(EncoderBarrier barrier) = 0;

    virtual void bindComputePipeline(VkPipeline pipeline) = 0;
    virtual void bindComputeDescriptorSet(VkPipelineLayout layout, uint32_t slot, VkDescriptorSet set) = 0;
    virtual void dispatch(uint32_t groupCountX, uint32_t groupCountY, uint32_t groupCountZ) = 0;
};
