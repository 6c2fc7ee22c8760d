#include "DescriptorManager.h"
#include <SDL3/SDL_log.h>

// ============================================================================
// LayoutBuilder
// ============================================================================

DescriptorManager::LayoutBuilder::LayoutBuilder(VkDevice device)
    : device_(device) {}

DescriptorManager::LayoutBuilder& DescriptorManager::LayoutBuilder::addUniformBuffer(
    uint32_t binding, VkShaderStageFlags stages) {
    return add(binding, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, stages);
}

DescriptorManager::LayoutBuilder& DescriptorManager::LayoutBuilder::addStorageBuffer(
    uint32_t binding, VkShaderStageFlags stages) {
    return add(binding, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, stages);
}

DescriptorManager::LayoutBuilder& DescriptorManager::LayoutBuilder::addSampler(
    uint32_t binding, VkShaderStageFlags stages) {
    return add(binding, VK_DESCRIPTOR_TYPE_SAMPLER, stages);
}

DescriptorManager::LayoutBuilder& DescriptorManager::LayoutBuilder::add(
    uint32_t binding, VkDescriptorType type, VkShaderStageFlags stages) {
    VkDescriptorSetLayoutBinding layoutBinding{};
    layoutBinding.binding = binding;
    layoutBinding.descriptorType = type;
    layoutBinding.descriptorCount = 1;
    layoutBinding.stageFlags = stages;
    bindings_.push_back(layoutBinding);
    return *this;
}

VkDescriptorSetLayout DescriptorManager::LayoutBuilder::build() const {
    VkDescriptorSetLayoutCreateInfo layoutInfo{};
    layoutInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    layoutInfo.bindingCount = static_cast<uint32_t>(bindings_.size());
    layoutInfo.pBindings = bindings_.data();

    VkDescriptorSetLayout layout = VK_NULL_HANDLE;
    VkResult result = vkCreateDescriptorSetLayout(device_, &layoutInfo, nullptr, &layout);
    if (result != VK_SUCCESS) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "DescriptorManager: Failed to create set layout (%zu bindings, VkResult %d)",
            bindings_.size(), result);
        return VK_NULL_HANDLE;
    }
    return layout;
}

// ============================================================================
// SetWriter
// ============================================================================

DescriptorManager::SetWriter::SetWriter(VkDevice device, VkDescriptorSet set)
    : device_(device), set_(set) {
    bufferInfos_.reserve(8);
    imageInfos_.reserve(8);
}

DescriptorManager::SetWriter& DescriptorManager::SetWriter::writeUniform(
    uint32_t binding, VkBuffer buffer, VkDeviceSize range) {
    return writeBuffer(binding, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, buffer, range);
}

DescriptorManager::SetWriter& DescriptorManager::SetWriter::writeStorage(
    uint32_t binding, VkBuffer buffer, VkDeviceSize range) {
    return writeBuffer(binding, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, buffer, range);
}

DescriptorManager::SetWriter& DescriptorManager::SetWriter::writeBuffer(
    uint32_t binding, VkDescriptorType type, VkBuffer buffer, VkDeviceSize range) {
    bufferInfos_.push_back({buffer, 0, range});

    VkWriteDescriptorSet write{};
    write.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
    write.dstSet = set_;
    write.dstBinding = binding;
    write.descriptorType = type;
    write.descriptorCount = 1;
    write.pBufferInfo = &bufferInfos_.back();
    writes_.push_back(write);
    return *this;
}

DescriptorManager::SetWriter& DescriptorManager::SetWriter::writeSampler(
    uint32_t binding, VkSampler sampler) {
    imageInfos_.push_back({sampler, VK_NULL_HANDLE, VK_IMAGE_LAYOUT_UNDEFINED});

    VkWriteDescriptorSet write{};
    write.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
    write.dstSet = set_;
    write.dstBinding = binding;
    write.descriptorType = VK_DESCRIPTOR_TYPE_SAMPLER;
    write.descriptorCount = 1;
    write.pImageInfo = &imageInfos_.back();
    writes_.push_back(write);
    return *this;
}

void DescriptorManager::SetWriter::update() {
    if (!writes_.empty()) {
        vkUpdateDescriptorSets(device_, static_cast<uint32_t>(writes_.size()),
                               writes_.data(), 0, nullptr);
    }
}

// ============================================================================
// Pool
// ============================================================================

DescriptorManager::Pool::Pool(VkDevice device, uint32_t setsPerPool)
    : device_(device), setsPerPool_(setsPerPool) {}

DescriptorManager::Pool::~Pool() {
    for (VkDescriptorPool pool : pools_) {
        vkDestroyDescriptorPool(device_, pool, nullptr);
    }
}

VkDescriptorPool DescriptorManager::Pool::createPool() const {
    // Largest per-set demand is the device cull compute set (1 UBO + 3 SSBOs)
    VkDescriptorPoolSize sizes[] = {
        {VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, setsPerPool_},
        {VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, 3 * setsPerPool_},
        {VK_DESCRIPTOR_TYPE_SAMPLER, 2 * setsPerPool_},
    };

    VkDescriptorPoolCreateInfo poolInfo{};
    poolInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    poolInfo.maxSets = setsPerPool_;
    poolInfo.poolSizeCount = 3;
    poolInfo.pPoolSizes = sizes;

    VkDescriptorPool pool = VK_NULL_HANDLE;
    if (vkCreateDescriptorPool(device_, &poolInfo, nullptr, &pool) != VK_SUCCESS) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "DescriptorManager: Failed to create descriptor pool");
        return VK_NULL_HANDLE;
    }
    return pool;
}

bool DescriptorManager::Pool::tryAllocate(VkDescriptorPool pool, VkDescriptorSetLayout layout,
                                          uint32_t count, std::vector<VkDescriptorSet>& outSets) const {
    std::vector<VkDescriptorSetLayout> layouts(count, layout);

    VkDescriptorSetAllocateInfo allocInfo{};
    allocInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    allocInfo.descriptorPool = pool;
    allocInfo.descriptorSetCount = count;
    allocInfo.pSetLayouts = layouts.data();

    outSets.resize(count);
    return vkAllocateDescriptorSets(device_, &allocInfo, outSets.data()) == VK_SUCCESS;
}

std::vector<VkDescriptorSet> DescriptorManager::Pool::allocate(VkDescriptorSetLayout layout,
                                                               uint32_t count) {
    std::vector<VkDescriptorSet> sets;

    // Newest pool is the only one that can still have room
    if (!pools_.empty() && tryAllocate(pools_.back(), layout, count, sets)) {
        return sets;
    }

    VkDescriptorPool pool = createPool();
    if (pool == VK_NULL_HANDLE) {
        return {};
    }
    pools_.push_back(pool);

    if (!tryAllocate(pool, layout, count, sets)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "DescriptorManager: Failed to allocate %u sets from a fresh pool", count);
        return {};
    }
    return sets;
}

VkDescriptorSet DescriptorManager::Pool::allocateSingle(VkDescriptorSetLayout layout) {
    auto sets = allocate(layout, 1);
    return sets.empty() ? VK_NULL_HANDLE : sets[0];
}
