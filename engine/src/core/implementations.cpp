// Single-header library implementations and the Vulkan dispatcher storage live
// in this translation unit only.

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#define VMA_IMPLEMENTATION
#define VMA_STATIC_VULKAN_FUNCTIONS 0
#define VMA_DYNAMIC_VULKAN_FUNCTIONS 1
#include <vk_mem_alloc.h>

#include <vulkan/vulkan.hpp>

// VULKAN_HPP_DISPATCH_LOADER_DYNAMIC=1 comes from the build files
VULKAN_HPP_DEFAULT_DISPATCH_LOADER_DYNAMIC_STORAGE
