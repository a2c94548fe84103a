#pragma once

#include "kiln/rhi/rhi_types.hpp"
#include <string_view>
#include <vulkan/vulkan.hpp>
#include <vk_mem_alloc.h>

namespace kiln::renderer::rhi::vulkan
{
    class VulkanUtils
    {
    public:
        // Format conversions
        static vk::Format toVkFormat(Format format);

        // Usage conversions
        static vk::BufferUsageFlags toVkBufferUsage(BufferUsage usage);
        static vk::ImageUsageFlags toVkImageUsage(TextureUsage usage);

        // Memory usage to VMA flags
        static VmaMemoryUsage toVmaMemoryUsage(MemoryUsage usage);

        static vk::ShaderStageFlags toVkShaderStage(ShaderStage stage);
        static vk::CompareOp toVkCompareOp(CompareOp op);
        static vk::Filter toVkFilter(Filter filter);
        static vk::SamplerAddressMode toVkAddressMode(SamplerAddressMode mode);
        static vk::DescriptorType toVkDescriptorType(DescriptorType type);
        static vk::Extent3D toVkExtent3D(const Extent3D& extent);

        // Logs on Logger::RHI and throws cpptrace::runtime_error unless eSuccess
        static void checkVkResult(vk::Result result, std::string_view operation);
    };
}
