#pragma once

// Recording render pass encoder for exercising the opaque pass without a GPU.
// Every call is appended to `events` so tests can assert on the exact
// command stream a pass produced.

#include "core/interfaces/IRenderPassEncoder.h"
#include "core/pipeline/GraphicsPipeline.h"

#include <cstdint>
#include <vector>

// Distinct, never-dereferenced handle values for non-dispatchable Vulkan handles
template<typename Handle>
Handle fakeHandle(uint64_t value) {
    return reinterpret_cast<Handle>(static_cast<uintptr_t>(value));
}

template<typename Handle>
uint64_t handleValue(Handle handle) {
    return static_cast<uint64_t>(reinterpret_cast<uintptr_t>(handle));
}

struct PassEvent {
    enum class Type {
        SetPipeline,
        SetBindGroup,
        SetVertexBuffer,
        SetIndexBuffer,
        DrawIndexed,
        DrawIndexedIndirect
    };

    Type type;
    const GraphicsPipeline* pipeline = nullptr;
    uint32_t slot = 0;
    uint64_t handle = 0;        // Descriptor set or buffer

    uint32_t indexCount = 0;
    uint32_t instanceCount = 0;
    uint32_t firstIndex = 0;
    int32_t vertexOffset = 0;
    uint32_t firstInstance = 0;

    VkDeviceSize offset = 0;
    uint32_t drawCount = 0;
    uint32_t stride = 0;
};

class RecordingRenderPassEncoder : public IRenderPassEncoder {
public:
    std::vector<PassEvent> events;

    void setPipeline(const GraphicsPipeline& pipeline) override {
        PassEvent event{PassEvent::Type::SetPipeline};
        event.pipeline = &pipeline;
        events.push_back(event);
    }

    void setBindGroup(uint32_t slot, VkDescriptorSet set) override {
        PassEvent event{PassEvent::Type::SetBindGroup};
        event.slot = slot;
        event.handle = handleValue(set);
        events.push_back(event);
    }

    void setVertexBuffer(VkBuffer buffer) override {
        PassEvent event{PassEvent::Type::SetVertexBuffer};
        event.handle = handleValue(buffer);
        events.push_back(event);
    }

    void setIndexBuffer(VkBuffer buffer) override {
        PassEvent event{PassEvent::Type::SetIndexBuffer};
        event.handle = handleValue(buffer);
        events.push_back(event);
    }

    void drawIndexed(uint32_t indexCount, uint32_t instanceCount,
                     uint32_t firstIndex, int32_t vertexOffset,
                     uint32_t firstInstance) override {
        PassEvent event{PassEvent::Type::DrawIndexed};
        event.indexCount = indexCount;
        event.instanceCount = instanceCount;
        event.firstIndex = firstIndex;
        event.vertexOffset = vertexOffset;
        event.firstInstance = firstInstance;
        events.push_back(event);
    }

    void drawIndexedIndirect(VkBuffer buffer, VkDeviceSize offset,
                             uint32_t drawCount, uint32_t stride) override {
        PassEvent event{PassEvent::Type::DrawIndexedIndirect};
        event.handle = handleValue(buffer);
        event.offset = offset;
        event.drawCount = drawCount;
        event.stride = stride;
        events.push_back(event);
    }

    size_t count(PassEvent::Type type) const {
        size_t n = 0;
        for (const auto& event : events) {
            if (event.type == type) ++n;
        }
        return n;
    }

    // Bind group events in recording order
    std::vector<PassEvent> bindGroups() const {
        std::vector<PassEvent> result;
        for (const auto& event : events) {
            if (event.type == PassEvent::Type::SetBindGroup) result.push_back(event);
        }
        return result;
    }
};
