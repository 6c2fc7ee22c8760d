#pragma once

#include <vulkan/vulkan.h>
#include <cstdint>
#include <vector>

// Descriptor layouts, writes and a growable pool for the culling core.
// Bindings are always given explicitly so they line up with shaders/bindings.h.

class DescriptorManager {
public:
    class LayoutBuilder {
    public:
        explicit LayoutBuilder(VkDevice device);

        LayoutBuilder& addUniformBuffer(uint32_t binding, VkShaderStageFlags stages);
        LayoutBuilder& addStorageBuffer(uint32_t binding, VkShaderStageFlags stages);
        LayoutBuilder& addSampler(uint32_t binding, VkShaderStageFlags stages);

        // VK_NULL_HANDLE on failure (logged)
        VkDescriptorSetLayout build() const;

    private:
        LayoutBuilder& add(uint32_t binding, VkDescriptorType type, VkShaderStageFlags stages);

        VkDevice device_;
        std::vector<VkDescriptorSetLayoutBinding> bindings_;
    };

    class SetWriter {
    public:
        SetWriter(VkDevice device, VkDescriptorSet set);

        SetWriter& writeUniform(uint32_t binding, VkBuffer buffer, VkDeviceSize range);
        SetWriter& writeStorage(uint32_t binding, VkBuffer buffer, VkDeviceSize range = VK_WHOLE_SIZE);
        SetWriter& writeSampler(uint32_t binding, VkSampler sampler);

        void update();

    private:
        SetWriter& writeBuffer(uint32_t binding, VkDescriptorType type,
                               VkBuffer buffer, VkDeviceSize range);

        VkDevice device_;
        VkDescriptorSet set_;
        std::vector<VkWriteDescriptorSet> writes_;
        // Stable addresses: pointed to by writes_ until update()
        std::vector<VkDescriptorBufferInfo> bufferInfos_;
        std::vector<VkDescriptorImageInfo> imageInfos_;
    };

    // Pool that adds another VkDescriptorPool when the current ones run dry
    class Pool {
    public:
        explicit Pool(VkDevice device, uint32_t setsPerPool = 16);
        ~Pool();

        Pool(const Pool&) = delete;
        Pool& operator=(const Pool&) = delete;

        // Empty vector on failure (logged)
        std::vector<VkDescriptorSet> allocate(VkDescriptorSetLayout layout, uint32_t count);
        VkDescriptorSet allocateSingle(VkDescriptorSetLayout layout);

        uint32_t getPoolCount() const { return static_cast<uint32_t>(pools_.size()); }

    private:
        VkDescriptorPool createPool() const;
        bool tryAllocate(VkDescriptorPool pool, VkDescriptorSetLayout layout,
                         uint32_t count, std::vector<VkDescriptorSet>& outSets) const;

        VkDevice device_;
        uint32_t setsPerPool_;
        std::vector<VkDescriptorPool> pools_;
    };
};
