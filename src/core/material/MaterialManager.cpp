#include "MaterialManager.h"
#include "core/CullingErrors.h"

MaterialHandle MaterialManager::registerMaterial(VkDescriptorSet bindGroup) {
    MaterialHandle handle = static_cast<MaterialHandle>(materials_.size());
    // Device index is dense in registration order
    materials_.push_back({bindGroup, handle});
    return handle;
}

const MaterialManager::MaterialEntry* MaterialManager::find(MaterialHandle handle) const {
    if (handle >= materials_.size()) {
        return nullptr;
    }
    return &materials_[handle];
}

VkDescriptorSet MaterialManager::getBindGroup(MaterialHandle handle) const {
    const MaterialEntry* entry = find(handle);
    if (!entry) {
        CullingErrors::fail<UnresolvedHandleError>(
            "MaterialManager: unknown material handle %u (%zu registered)",
            handle, materials_.size());
    }
    return entry->bindGroup;
}

VkDescriptorSet MaterialManager::getDeviceBindGroup() const {
    if (deviceBindGroup_ == VK_NULL_HANDLE) {
        CullingErrors::fail<ContractViolation>(
            "MaterialManager: device material table requested but never set");
    }
    return deviceBindGroup_;
}
