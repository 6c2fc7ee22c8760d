#pragma once

#include <vulkan/vulkan.hpp>
#include <vk_mem_alloc.h>
#include <SDL3/SDL_log.h>
#include <memory>
#include <type_traits>

// ============================================================================
// VmaBufferDeleter - Deleter for VMA-allocated buffers
// ============================================================================

struct VmaBufferDeleter {
    VmaAllocator allocator = VK_NULL_HANDLE;
    VmaAllocation allocation = VK_NULL_HANDLE;

    using pointer = VkBuffer;

    void operator()(VkBuffer buffer) const noexcept {
        if (buffer != VK_NULL_HANDLE && allocator != VK_NULL_HANDLE) {
            vmaDestroyBuffer(allocator, buffer, allocation);
        }
    }
};

using UniqueVmaBuffer = std::unique_ptr<std::remove_pointer_t<VkBuffer>, VmaBufferDeleter>;

// ============================================================================
// VmaBuffer - RAII VkBuffer + VmaAllocation
// ============================================================================
//
// Host-visible buffers are created persistently mapped (VMA_ALLOCATION_CREATE_MAPPED_BIT);
// mappedData() is null for device-local buffers.

class VmaBuffer {
public:
    VmaBuffer() = default;

    VmaBuffer(VmaBuffer&&) noexcept = default;
    VmaBuffer& operator=(VmaBuffer&&) noexcept = default;
    VmaBuffer(const VmaBuffer&) = delete;
    VmaBuffer& operator=(const VmaBuffer&) = delete;

    static bool create(VmaAllocator allocator,
                       const vk::BufferCreateInfo& bufferInfo,
                       const VmaAllocationCreateInfo& allocInfo,
                       VmaBuffer& outBuffer) {
        VkBuffer buffer = VK_NULL_HANDLE;
        VmaAllocation allocation = VK_NULL_HANDLE;
        VmaAllocationInfo allocationInfo{};

        VkResult vkResult = vmaCreateBuffer(allocator,
            reinterpret_cast<const VkBufferCreateInfo*>(&bufferInfo),
            &allocInfo, &buffer, &allocation, &allocationInfo);
        if (vkResult != VK_SUCCESS) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                "VmaBuffer::create failed: %d (size %llu)", vkResult,
                static_cast<unsigned long long>(bufferInfo.size));
            return false;
        }

        VmaBuffer result;
        result.handle_ = UniqueVmaBuffer(buffer, VmaBufferDeleter{allocator, allocation});
        result.mapped_ = allocationInfo.pMappedData;
        result.size_ = bufferInfo.size;
        outBuffer = std::move(result);
        return true;
    }

    VkBuffer get() const { return handle_.get(); }
    explicit operator bool() const { return static_cast<bool>(handle_); }

    VmaAllocator allocator() const { return handle_.get_deleter().allocator; }
    VmaAllocation getAllocation() const { return handle_.get_deleter().allocation; }

    void* mappedData() const { return mapped_; }
    vk::DeviceSize size() const { return size_; }

    // Make host writes visible to the device (no-op on coherent memory)
    void flush(vk::DeviceSize offset = 0, vk::DeviceSize size = VK_WHOLE_SIZE) const {
        if (handle_) {
            vmaFlushAllocation(allocator(), getAllocation(), offset, size);
        }
    }

    // Make device writes visible to the host before reading mappedData()
    void invalidate(vk::DeviceSize offset = 0, vk::DeviceSize size = VK_WHOLE_SIZE) const {
        if (handle_) {
            vmaInvalidateAllocation(allocator(), getAllocation(), offset, size);
        }
    }

    void reset() {
        handle_.reset();
        mapped_ = nullptr;
        size_ = 0;
    }

private:
    UniqueVmaBuffer handle_;
    void* mapped_ = nullptr;
    vk::DeviceSize size_ = 0;
};

// ============================================================================
// BufferBuilder - Fluent API for creating VMA buffers
// ============================================================================

class BufferBuilder {
public:
    explicit BufferBuilder(VmaAllocator allocator)
        : allocator_(allocator) {
        allocInfo_.usage = VMA_MEMORY_USAGE_AUTO;
    }

    BufferBuilder& setSize(vk::DeviceSize size) {
        bufferInfo_.setSize(size);
        return *this;
    }

    BufferBuilder& asUniform() {
        bufferInfo_.setUsage(bufferInfo_.usage | vk::BufferUsageFlagBits::eUniformBuffer);
        return *this;
    }

    BufferBuilder& asStorage() {
        bufferInfo_.setUsage(bufferInfo_.usage | vk::BufferUsageFlagBits::eStorageBuffer);
        return *this;
    }

    BufferBuilder& asIndirect() {
        bufferInfo_.setUsage(bufferInfo_.usage | vk::BufferUsageFlagBits::eIndirectBuffer);
        return *this;
    }

    BufferBuilder& asTransferSrc() {
        bufferInfo_.setUsage(bufferInfo_.usage | vk::BufferUsageFlagBits::eTransferSrc);
        return *this;
    }

    BufferBuilder& asTransferDst() {
        bufferInfo_.setUsage(bufferInfo_.usage | vk::BufferUsageFlagBits::eTransferDst);
        return *this;
    }

    // CPU writes sequentially every frame
    BufferBuilder& hostVisible() {
        allocInfo_.flags |= VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT |
                           VMA_ALLOCATION_CREATE_MAPPED_BIT;
        return *this;
    }

    // GPU writes, CPU reads back
    BufferBuilder& hostReadable() {
        allocInfo_.flags |= VMA_ALLOCATION_CREATE_HOST_ACCESS_RANDOM_BIT |
                           VMA_ALLOCATION_CREATE_MAPPED_BIT;
        return *this;
    }

    BufferBuilder& deviceLocal() {
        allocInfo_.requiredFlags = VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT;
        return *this;
    }

    bool build(VmaBuffer& outBuffer) const {
        auto info = bufferInfo_;
        info.setSharingMode(vk::SharingMode::eExclusive);
        return VmaBuffer::create(allocator_, info, allocInfo_, outBuffer);
    }

private:
    VmaAllocator allocator_;
    vk::BufferCreateInfo bufferInfo_{};
    VmaAllocationCreateInfo allocInfo_{};
};
