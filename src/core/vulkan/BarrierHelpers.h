#pragma once

#include <vulkan/vulkan.hpp>

/**
 * BarrierHelpers - Pipeline barrier patterns used by GPU-driven culling
 *
 * Global memory barriers only; the buffers involved are written and read
 * within a single queue submission.
 */
namespace BarrierHelpers {

/**
 * Barrier after a transfer write (copy/fill) before compute reads or atomics
 */
inline void transferToCompute(vk::CommandBuffer cmd) {
    auto memBarrier = vk::MemoryBarrier{}
        .setSrcAccessMask(vk::AccessFlagBits::eTransferWrite)
        .setDstAccessMask(vk::AccessFlagBits::eShaderRead | vk::AccessFlagBits::eShaderWrite);

    cmd.pipelineBarrier(
        vk::PipelineStageFlagBits::eTransfer,
        vk::PipelineStageFlagBits::eComputeShader,
        {}, memBarrier, {}, {});
}

/**
 * Barrier after compute write before indirect draw and vertex-stage SSBO reads
 */
inline void computeToIndirectDraw(vk::CommandBuffer cmd) {
    auto memBarrier = vk::MemoryBarrier{}
        .setSrcAccessMask(vk::AccessFlagBits::eShaderWrite)
        .setDstAccessMask(vk::AccessFlagBits::eIndirectCommandRead | vk::AccessFlagBits::eShaderRead);

    cmd.pipelineBarrier(
        vk::PipelineStageFlagBits::eComputeShader,
        vk::PipelineStageFlagBits::eDrawIndirect | vk::PipelineStageFlagBits::eVertexShader,
        {}, memBarrier, {}, {});
}

} // namespace BarrierHelpers
