#include "kiln/rhi/vulkan/vulkan_texture.hpp"

#include "kiln/core/common.hpp"
#include "kiln/core/logger.hpp"
#include "kiln/rhi/vulkan/vulkan_buffer.hpp"
#include "kiln/rhi/vulkan/vulkan_device.hpp"
#include "kiln/rhi/vulkan/vulkan_utils.hpp"
#include <cpptrace/cpptrace.hpp>
#include <algorithm>
#include <utility>

using namespace kiln::util;

namespace kiln::renderer::rhi::vulkan
{
    namespace
    {
        std::pair<vk::PipelineStageFlags2, vk::AccessFlags2> layoutStageAccess(vk::ImageLayout layout)
        {
            switch (layout)
            {
            case vk::ImageLayout::eTransferDstOptimal:
                return {vk::PipelineStageFlagBits2::eTransfer, vk::AccessFlagBits2::eTransferWrite};
            case vk::ImageLayout::eShaderReadOnlyOptimal:
                return {vk::PipelineStageFlagBits2::eFragmentShader, vk::AccessFlagBits2::eShaderSampledRead};
            default:
                return {vk::PipelineStageFlagBits2::eTopOfPipe, vk::AccessFlagBits2::eNone};
            }
        }
    }

    VulkanRHITexture::VulkanRHITexture(VulkanRHIDevice* device, const TextureDescriptor& desc)
        : m_device(device)
        , m_extent(desc.extent)
        , m_format(desc.format)
        , m_mipLevels(desc.mipLevels)
        , m_arrayLayers(desc.arrayLayers)
        , m_usage(desc.usage)
    {
        vk::ImageCreateInfo imageInfo{};
        imageInfo.imageType = vk::ImageType::e2D;
        imageInfo.format = VulkanUtils::toVkFormat(desc.format);
        imageInfo.extent = VulkanUtils::toVkExtent3D(desc.extent);
        imageInfo.mipLevels = desc.mipLevels;
        imageInfo.arrayLayers = desc.arrayLayers;
        imageInfo.samples = vk::SampleCountFlagBits::e1;
        imageInfo.tiling = vk::ImageTiling::eOptimal;
        imageInfo.usage = VulkanUtils::toVkImageUsage(desc.usage);
        imageInfo.sharingMode = vk::SharingMode::eExclusive;
        imageInfo.initialLayout = vk::ImageLayout::eUndefined;

        VmaAllocationCreateInfo allocInfo{};
        allocInfo.usage = VMA_MEMORY_USAGE_GPU_ONLY;

        auto cImageInfo = static_cast<VkImageCreateInfo>(imageInfo);
        VkImage cImage = nullptr;
        auto result = static_cast<vk::Result>(
            vmaCreateImage(m_device->allocator(), &cImageInfo, &allocInfo, &cImage, &m_allocation, nullptr));
        if (result != vk::Result::eSuccess)
        {
            core::Logger::RHI.error("Failed to create texture '{}' ({}x{}): {}",
                                    desc.debugName != nullptr ? desc.debugName : "<unnamed>",
                                    desc.extent.width, desc.extent.height, vk::to_string(result));
            throw cpptrace::runtime_error("Texture creation failed");
        }
        m_image = cImage;

        vk::ImageViewCreateInfo viewInfo{};
        viewInfo.image = m_image;
        viewInfo.viewType = vk::ImageViewType::e2D;
        viewInfo.format = imageInfo.format;
        viewInfo.subresourceRange.aspectMask = vk::ImageAspectFlagBits::eColor;
        viewInfo.subresourceRange.baseMipLevel = 0;
        viewInfo.subresourceRange.levelCount = m_mipLevels;
        viewInfo.subresourceRange.baseArrayLayer = 0;
        viewInfo.subresourceRange.layerCount = m_arrayLayers;
        m_imageView = m_device->device().createImageView(viewInfo);

        core::Logger::RHI.trace("VulkanRHITexture created: {} ({}x{})",
                                desc.debugName != nullptr ? desc.debugName : "<unnamed>",
                                m_extent.width, m_extent.height);
    }

    VulkanRHITexture::~VulkanRHITexture()
    {
        if (m_imageView) {
            m_device->device().destroyImageView(m_imageView);
        }
        vmaDestroyImage(m_device->allocator(), m_image, m_allocation);
    }

    void VulkanRHITexture::uploadData(std::span<const std::byte> data, const TextureSubresource& subresource)
    {
        const uint64_t width = std::max(1U, m_extent.width >> subresource.mipLevel);
        const uint64_t height = std::max(1U, m_extent.height >> subresource.mipLevel);
        const uint64_t expected = width * height * bytesPerTexel(m_format);
        if (data.size() < expected)
        {
            core::Logger::RHI.error("Texture upload too small: {} bytes, expected {}", data.size(), expected);
            throw cpptrace::runtime_error("Texture upload size mismatch");
        }

        BufferDescriptor stagingDesc{};
        stagingDesc.size = expected;
        stagingDesc.usage = BufferUsage::TransferSrc;
        stagingDesc.memoryUsage = MemoryUsage::CPUOnly;
        stagingDesc.debugName = "TextureUploadStaging";
        VulkanRHIBuffer staging(m_device, stagingDesc);
        staging.uploadData(data.first(expected), 0);

        m_device->immediateSubmit([&](vk::CommandBuffer cmd) {
            transitionLayout(cmd, vk::ImageLayout::eTransferDstOptimal);

            vk::BufferImageCopy region{};
            region.bufferOffset = 0;
            region.bufferRowLength = 0;
            region.bufferImageHeight = 0;
            region.imageSubresource.aspectMask = vk::ImageAspectFlagBits::eColor;
            region.imageSubresource.mipLevel = subresource.mipLevel;
            region.imageSubresource.baseArrayLayer = subresource.arrayLayer;
            region.imageSubresource.layerCount = 1;
            region.imageOffset = vk::Offset3D{0, 0, 0};
            region.imageExtent = vk::Extent3D{u32(width), u32(height), 1};

            cmd.copyBufferToImage(staging.buffer(), m_image, vk::ImageLayout::eTransferDstOptimal, region);

            transitionLayout(cmd, vk::ImageLayout::eShaderReadOnlyOptimal);
        });
    }

    void VulkanRHITexture::transitionLayout(vk::CommandBuffer cmd, vk::ImageLayout newLayout)
    {
        vk::ImageMemoryBarrier2 barrier{};
        barrier.oldLayout = m_currentLayout;
        barrier.newLayout = newLayout;
        barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        barrier.image = m_image;
        barrier.subresourceRange.aspectMask = vk::ImageAspectFlagBits::eColor;
        barrier.subresourceRange.baseMipLevel = 0;
        barrier.subresourceRange.levelCount = m_mipLevels;
        barrier.subresourceRange.baseArrayLayer = 0;
        barrier.subresourceRange.layerCount = m_arrayLayers;

        auto [srcStage, srcAccess] = layoutStageAccess(m_currentLayout);
        auto [dstStage, dstAccess] = layoutStageAccess(newLayout);

        barrier.srcAccessMask = srcAccess;
        barrier.dstAccessMask = dstAccess;
        barrier.srcStageMask = srcStage;
        barrier.dstStageMask = dstStage;

        vk::DependencyInfo depInfo{};
        depInfo.imageMemoryBarrierCount = 1;
        depInfo.pImageMemoryBarriers = &barrier;

        cmd.pipelineBarrier2(depInfo);

        m_currentLayout = newLayout;
    }
}
