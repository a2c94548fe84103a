#include "kiln/rhi/vulkan/vulkan_descriptor.hpp"

#include "kiln/rhi/rhi_buffer.hpp"
#include "kiln/rhi/rhi_sampler.hpp"
#include "kiln/rhi/rhi_texture.hpp"
#include "kiln/rhi/vulkan/vulkan_device.hpp"
#include "kiln/rhi/vulkan/vulkan_utils.hpp"
#include "kiln/core/logger.hpp"

namespace kiln::renderer::rhi::vulkan
{
    VulkanRHIDescriptorSetLayout::VulkanRHIDescriptorSetLayout(
        VulkanRHIDevice* device,
        vk::DescriptorSetLayout layout,
        const DescriptorSetLayout& desc)
        : m_device(device)
        , m_layout(layout)
        , m_desc(desc)
    {
    }

    VulkanRHIDescriptorSetLayout::~VulkanRHIDescriptorSetLayout()
    {
        if (m_layout)
        {
            m_device->device().destroyDescriptorSetLayout(m_layout);
        }
    }

    VulkanRHIDescriptorSet::VulkanRHIDescriptorSet(
        VulkanRHIDevice* device,
        VulkanRHIDescriptorSetLayout* layout,
        vk::DescriptorSet set)
        : m_device(device)
        , m_layout(layout)
        , m_set(set)
    {
    }

    VulkanRHIDescriptorSet::~VulkanRHIDescriptorSet()
    {
        if (m_set)
        {
            m_device->device().freeDescriptorSets(m_device->descriptorPool(), m_set);
        }
    }

    void VulkanRHIDescriptorSet::updateBuffer(uint32_t binding,
                                              RHIBuffer* buffer,
                                              uint64_t offset,
                                              uint64_t range)
    {
        if (buffer == nullptr)
        {
            core::Logger::RHI.error("updateBuffer: buffer is null");
            return;
        }

        const auto* slot = m_layout->binding(binding);
        if (slot == nullptr ||
            (slot->type != DescriptorType::UniformBuffer && slot->type != DescriptorType::StorageBuffer))
        {
            core::Logger::RHI.error("updateBuffer: binding {} is not a buffer descriptor", binding);
            return;
        }

        vk::DescriptorBufferInfo bufferInfo{};
        bufferInfo.buffer = vk::Buffer(static_cast<VkBuffer>(buffer->nativeHandle()));
        bufferInfo.offset = offset;
        bufferInfo.range = range;

        vk::WriteDescriptorSet write{};
        write.dstSet = m_set;
        write.dstBinding = binding;
        write.descriptorType = VulkanUtils::toVkDescriptorType(slot->type);
        write.descriptorCount = 1;
        write.pBufferInfo = &bufferInfo;

        m_device->device().updateDescriptorSets(write, nullptr);
    }

    void VulkanRHIDescriptorSet::updateTexture(uint32_t binding,
                                               RHITexture* texture,
                                               RHISampler* sampler)
    {
        const auto* slot = m_layout->binding(binding);
        if (slot == nullptr || !isImageDescriptor(slot->type))
        {
            core::Logger::RHI.error("updateTexture: binding {} is not an image descriptor", binding);
            return;
        }
        const DescriptorType type = slot->type;
        if (type != DescriptorType::Sampler && texture == nullptr)
        {
            core::Logger::RHI.error("updateTexture: texture is null");
            return;
        }
        if ((type == DescriptorType::CombinedImageSampler || type == DescriptorType::Sampler) &&
            (sampler == nullptr))
        {
            core::Logger::RHI.error("updateTexture: sampler is null");
            return;
        }

        vk::DescriptorImageInfo imageInfo{};
        if (type == DescriptorType::Sampler) {
            imageInfo.sampler = vk::Sampler(static_cast<VkSampler>(sampler->nativeHandle()));
        } else {
            imageInfo.imageView = vk::ImageView(static_cast<VkImageView>(texture->nativeView()));
            if (type == DescriptorType::StorageImage)
            {
                imageInfo.imageLayout = vk::ImageLayout::eGeneral;
            }
            else
            {
                imageInfo.imageLayout = vk::ImageLayout::eShaderReadOnlyOptimal;
                if (type == DescriptorType::CombinedImageSampler)
                {
                    imageInfo.sampler = vk::Sampler(static_cast<VkSampler>(sampler->nativeHandle()));
                }
            }
        }

        vk::WriteDescriptorSet write{};
        write.dstSet = m_set;
        write.dstBinding = binding;
        write.descriptorType = VulkanUtils::toVkDescriptorType(type);
        write.descriptorCount = 1;
        write.pImageInfo = &imageInfo;

        m_device->device().updateDescriptorSets(write, nullptr);
    }
} // namespace kiln::renderer::rhi::vulkan
