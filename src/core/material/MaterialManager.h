#pragma once

#include "scene/SceneObject.h"

#include <vulkan/vulkan.h>
#include <cstdint>
#include <vector>

/**
 * MaterialManager - Material table as seen by the opaque pass
 *
 * Each material has two faces:
 * - a per-material descriptor set, bound per batch by the host strategy
 * - a dense device index into the GPU-visible material table, which the
 *   device strategy binds once (deviceBindGroup) and resolves in shaders
 *
 * Parameter/texture upload and residency are handled elsewhere; this class
 * only records the resulting bindings. Read-only while a frame is recorded.
 */
class MaterialManager {
public:
    struct MaterialEntry {
        VkDescriptorSet bindGroup = VK_NULL_HANDLE;
        uint32_t deviceIndex = 0;
    };

    MaterialManager() = default;

    MaterialHandle registerMaterial(VkDescriptorSet bindGroup);

    // nullptr when the handle was never registered
    const MaterialEntry* find(MaterialHandle handle) const;

    // Raises UnresolvedHandleError for unknown handles
    VkDescriptorSet getBindGroup(MaterialHandle handle) const;

    // GPU-visible material table (device strategy only)
    void setDeviceBindGroup(VkDescriptorSet bindGroup) { deviceBindGroup_ = bindGroup; }
    VkDescriptorSet getDeviceBindGroup() const;

    size_t getMaterialCount() const { return materials_.size(); }

private:
    std::vector<MaterialEntry> materials_;
    VkDescriptorSet deviceBindGroup_ = VK_NULL_HANDLE;
};
