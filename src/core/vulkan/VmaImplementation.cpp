// The single translation unit that compiles the Vulkan Memory Allocator
#define VMA_IMPLEMENTATION
#include <vk_mem_alloc.h>
