// Single source of truth for shader bindings
// This file is designed to be included by both C++ and GLSL code
// C++: #include "shaders/bindings.h"
// GLSL: #include "bindings.h"

#ifndef BINDINGS_H
#define BINDINGS_H

// =============================================================================
// Opaque Cull Compute Descriptor Set (device strategy)
// =============================================================================
#define BINDING_OPAQUE_CULL_UNIFORMS        0   // OpaqueCullUniforms (UBO)
#define BINDING_OPAQUE_CULL_OBJECTS         1   // GPUCullObject array (SSBO, read-only)
#define BINDING_OPAQUE_CULL_INDIRECT        2   // VkDrawIndexedIndirectCommand array (SSBO, atomics)
#define BINDING_OPAQUE_CULL_VISIBLE         3   // Visible object indices (SSBO, write)

// Compute workgroup size (must match local_size_x in opaque_cull.comp)
#define OPAQUE_CULL_WORKGROUP_SIZE         64

// =============================================================================
// Culled Output Descriptor Set (bound at slot 1 of both opaque pipelines)
// =============================================================================
// Host strategy: instance data is pre-ordered by batch range
#define BINDING_CULL_OUTPUT_UNIFORMS        0   // Per-frame camera uniforms
#define BINDING_CULL_OUTPUT_INSTANCES       1   // HostInstanceData array

// Device strategy: vertex shader indirects through the visible index buffer
#define BINDING_CULL_OUTPUT_OBJECTS         1   // GPUCullObject array
#define BINDING_CULL_OUTPUT_VISIBLE         2   // Visible object indices

// =============================================================================
// Sampler Descriptor Set (slot 0 of both opaque pipelines)
// =============================================================================
#define BINDING_SAMPLER_LINEAR              0
#define BINDING_SAMPLER_NEAREST             1

#endif // BINDINGS_H
