#include "MeshBuffers.h"
#include "core/interfaces/IRenderPassEncoder.h"

MeshHandle MeshBuffers::addMesh(const MeshRange& range) {
    MeshHandle handle = static_cast<MeshHandle>(meshes_.size());
    meshes_.push_back(range);
    return handle;
}

const MeshRange* MeshBuffers::find(MeshHandle handle) const {
    if (handle >= meshes_.size()) {
        return nullptr;
    }
    return &meshes_[handle];
}

void MeshBuffers::bind(IRenderPassEncoder& encoder) const {
    encoder.setVertexBuffer(vertexBuffer_);
    encoder.setIndexBuffer(indexBuffer_);
}
