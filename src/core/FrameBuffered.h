#pragma once

// ============================================================================
// FrameBuffered.h - N copies of a per-frame resource, one per frame in flight
// ============================================================================
//
// The frame index supplied by the frame-orchestration layer is the source of
// truth: resources are always addressed with at(frameIndex), which wraps the
// index modulo the buffering depth. A frame only ever touches its own slot,
// so the slot of a frame still executing on the GPU is never rewritten.
//
// Usage:
//   FrameBuffered<VmaBuffer> instanceBuffers;
//   instanceBuffers.resize(framesInFlight, [&](uint32_t) { return makeBuffer(); });
//   VkBuffer buffer = instanceBuffers.at(frameIndex).get();
//

#include <cstdint>
#include <vector>
#include <cassert>

template<typename T>
class FrameBuffered {
public:
    FrameBuffered() = default;

    explicit FrameBuffered(uint32_t frameCount)
        : resources_(frameCount) {}

    // Resize with a generator invoked once per frame slot
    template<typename Generator>
    void resize(uint32_t frameCount, Generator&& generator) {
        resources_.clear();
        resources_.reserve(frameCount);
        for (uint32_t i = 0; i < frameCount; ++i) {
            resources_.push_back(generator(i));
        }
    }

    void clear() { resources_.clear(); }

    uint32_t frameCount() const { return static_cast<uint32_t>(resources_.size()); }
    bool empty() const { return resources_.empty(); }

    uint32_t wrapIndex(uint32_t frameIndex) const {
        assert(!resources_.empty() && "FrameBuffered not initialized");
        return frameIndex % frameCount();
    }

    T& at(uint32_t frameIndex) { return resources_[wrapIndex(frameIndex)]; }
    const T& at(uint32_t frameIndex) const { return resources_[wrapIndex(frameIndex)]; }

    auto begin() { return resources_.begin(); }
    auto end() { return resources_.end(); }
    auto begin() const { return resources_.begin(); }
    auto end() const { return resources_.end(); }

    template<typename Func>
    void forEach(Func&& func) {
        for (uint32_t i = 0; i < frameCount(); ++i) {
            func(i, resources_[i]);
        }
    }

private:
    std::vector<T> resources_;
};
