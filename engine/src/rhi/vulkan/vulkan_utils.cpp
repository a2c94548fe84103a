#include "kiln/rhi/vulkan/vulkan_utils.hpp"

#include "kiln/core/logger.hpp"
#include <array>
#include <cpptrace/cpptrace.hpp>
#include <string>

namespace kiln::renderer::rhi::vulkan
{
    vk::Format VulkanUtils::toVkFormat(Format format)
    {
        switch (format)
        {
        case Format::R8G8B8A8_UNORM: return vk::Format::eR8G8B8A8Unorm;
        case Format::R8G8B8A8_SRGB: return vk::Format::eR8G8B8A8Srgb;
        case Format::B8G8R8A8_UNORM: return vk::Format::eB8G8R8A8Unorm;
        case Format::B8G8R8A8_SRGB: return vk::Format::eB8G8R8A8Srgb;
        case Format::R32G32_SFLOAT: return vk::Format::eR32G32Sfloat;
        case Format::R32G32B32_SFLOAT: return vk::Format::eR32G32B32Sfloat;
        case Format::R32G32B32A32_SFLOAT: return vk::Format::eR32G32B32A32Sfloat;
        case Format::R32G32B32A32_UINT: return vk::Format::eR32G32B32A32Uint;
        case Format::Undefined: return vk::Format::eUndefined;
        }
        return vk::Format::eUndefined;
    }

    namespace
    {
        template <typename Flag, typename VkBits>
        struct FlagMapping
        {
            Flag flag;
            VkBits bit;
        };

        template <typename VkFlags, typename Flag, typename VkBits, size_t N>
        VkFlags translateFlags(Flag value, const std::array<FlagMapping<Flag, VkBits>, N>& table)
        {
            VkFlags flags{};
            for (const auto& [flag, bit] : table)
            {
                if (hasFlag(value, flag))
                {
                    flags |= bit;
                }
            }
            return flags;
        }

        constexpr std::array<FlagMapping<BufferUsage, vk::BufferUsageFlagBits>, 6> kBufferUsageBits = {{
            {BufferUsage::TransferSrc, vk::BufferUsageFlagBits::eTransferSrc},
            {BufferUsage::TransferDst, vk::BufferUsageFlagBits::eTransferDst},
            {BufferUsage::UniformBuffer, vk::BufferUsageFlagBits::eUniformBuffer},
            {BufferUsage::StorageBuffer, vk::BufferUsageFlagBits::eStorageBuffer},
            {BufferUsage::IndexBuffer, vk::BufferUsageFlagBits::eIndexBuffer},
            {BufferUsage::VertexBuffer, vk::BufferUsageFlagBits::eVertexBuffer},
        }};

        constexpr std::array<FlagMapping<TextureUsage, vk::ImageUsageFlagBits>, 4> kImageUsageBits = {{
            {TextureUsage::TransferSrc, vk::ImageUsageFlagBits::eTransferSrc},
            {TextureUsage::TransferDst, vk::ImageUsageFlagBits::eTransferDst},
            {TextureUsage::Sampled, vk::ImageUsageFlagBits::eSampled},
            {TextureUsage::Storage, vk::ImageUsageFlagBits::eStorage},
        }};

        constexpr std::array<FlagMapping<ShaderStage, vk::ShaderStageFlagBits>, 3> kShaderStageBits = {{
            {ShaderStage::Vertex, vk::ShaderStageFlagBits::eVertex},
            {ShaderStage::Fragment, vk::ShaderStageFlagBits::eFragment},
            {ShaderStage::Compute, vk::ShaderStageFlagBits::eCompute},
        }};
    }

    vk::BufferUsageFlags VulkanUtils::toVkBufferUsage(BufferUsage usage)
    {
        return translateFlags<vk::BufferUsageFlags>(usage, kBufferUsageBits);
    }

    vk::ImageUsageFlags VulkanUtils::toVkImageUsage(TextureUsage usage)
    {
        return translateFlags<vk::ImageUsageFlags>(usage, kImageUsageBits);
    }

    VmaMemoryUsage VulkanUtils::toVmaMemoryUsage(MemoryUsage usage)
    {
        switch (usage)
        {
        case MemoryUsage::GPUOnly: return VMA_MEMORY_USAGE_GPU_ONLY;
        case MemoryUsage::CPUToGPU: return VMA_MEMORY_USAGE_CPU_TO_GPU;
        case MemoryUsage::GPUToCPU: return VMA_MEMORY_USAGE_GPU_TO_CPU;
        case MemoryUsage::CPUOnly: return VMA_MEMORY_USAGE_CPU_ONLY;
        }
        return VMA_MEMORY_USAGE_AUTO;
    }

    vk::ShaderStageFlags VulkanUtils::toVkShaderStage(ShaderStage stage)
    {
        return translateFlags<vk::ShaderStageFlags>(stage, kShaderStageBits);
    }

    vk::CompareOp VulkanUtils::toVkCompareOp(CompareOp op)
    {
        switch (op)
        {
        case CompareOp::None:
        case CompareOp::Never: return vk::CompareOp::eNever;
        case CompareOp::Less: return vk::CompareOp::eLess;
        case CompareOp::Equal: return vk::CompareOp::eEqual;
        case CompareOp::LessOrEqual: return vk::CompareOp::eLessOrEqual;
        case CompareOp::Greater: return vk::CompareOp::eGreater;
        case CompareOp::NotEqual: return vk::CompareOp::eNotEqual;
        case CompareOp::GreaterOrEqual: return vk::CompareOp::eGreaterOrEqual;
        case CompareOp::Always: return vk::CompareOp::eAlways;
        }
        return vk::CompareOp::eNever;
    }

    vk::Filter VulkanUtils::toVkFilter(Filter filter)
    {
        return filter == Filter::Linear ? vk::Filter::eLinear : vk::Filter::eNearest;
    }

    vk::SamplerAddressMode VulkanUtils::toVkAddressMode(SamplerAddressMode mode)
    {
        switch (mode)
        {
        case SamplerAddressMode::Repeat: return vk::SamplerAddressMode::eRepeat;
        case SamplerAddressMode::MirroredRepeat: return vk::SamplerAddressMode::eMirroredRepeat;
        case SamplerAddressMode::ClampToEdge: return vk::SamplerAddressMode::eClampToEdge;
        case SamplerAddressMode::ClampToBorder: return vk::SamplerAddressMode::eClampToBorder;
        }
        return vk::SamplerAddressMode::eRepeat;
    }

    vk::DescriptorType VulkanUtils::toVkDescriptorType(DescriptorType type)
    {
        switch (type)
        {
        case DescriptorType::Sampler: return vk::DescriptorType::eSampler;
        case DescriptorType::CombinedImageSampler: return vk::DescriptorType::eCombinedImageSampler;
        case DescriptorType::SampledImage: return vk::DescriptorType::eSampledImage;
        case DescriptorType::StorageImage: return vk::DescriptorType::eStorageImage;
        case DescriptorType::UniformBuffer: return vk::DescriptorType::eUniformBuffer;
        case DescriptorType::StorageBuffer: return vk::DescriptorType::eStorageBuffer;
        }
        return vk::DescriptorType::eUniformBuffer;
    }

    vk::Extent3D VulkanUtils::toVkExtent3D(const Extent3D& extent)
    {
        return vk::Extent3D{extent.width, extent.height, extent.depth};
    }

    void VulkanUtils::checkVkResult(vk::Result result, std::string_view operation)
    {
        if (result == vk::Result::eSuccess) {
            return;
        }
        core::Logger::RHI.error("{} failed: {}", operation, vk::to_string(result));
        throw cpptrace::runtime_error(std::string(operation) + " failed: " + vk::to_string(result));
    }
}
