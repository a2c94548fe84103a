#pragma once

#include "kiln/rhi/rhi_texture.hpp"
#include <vulkan/vulkan.hpp>
#include <vk_mem_alloc.h>

namespace kiln::renderer::rhi::vulkan
{
    class VulkanRHIDevice;

    class VulkanRHITexture : public RHITexture
    {
    public:
        VulkanRHITexture(VulkanRHIDevice* device, const TextureDescriptor& desc);
        ~VulkanRHITexture() override;

        VulkanRHITexture(const VulkanRHITexture&) = delete;
        VulkanRHITexture& operator=(const VulkanRHITexture&) = delete;

        // Stages the data, copies it into the image and leaves the image shader-readable
        void uploadData(std::span<const std::byte> data,
                        const TextureSubresource& subresource = {}) override;

        const Extent3D& extent() const override { return m_extent; }
        Format format() const override { return m_format; }
        uint32_t mipLevels() const override { return m_mipLevels; }
        uint32_t arrayLayers() const override { return m_arrayLayers; }
        TextureUsage usage() const override { return m_usage; }

        void* nativeHandle() const override { return static_cast<VkImage>(m_image); }
        void* nativeView() const override { return static_cast<VkImageView>(m_imageView); }

        vk::Image image() const { return m_image; }
        vk::ImageView imageView() const { return m_imageView; }

    private:
        void transitionLayout(vk::CommandBuffer cmd, vk::ImageLayout newLayout);

        VulkanRHIDevice* m_device;
        vk::Image m_image;
        vk::ImageView m_imageView;
        VmaAllocation m_allocation{};
        vk::ImageLayout m_currentLayout = vk::ImageLayout::eUndefined;

        Extent3D m_extent;
        Format m_format;
        uint32_t m_mipLevels;
        uint32_t m_arrayLayers;
        TextureUsage m_usage;
    };
}
