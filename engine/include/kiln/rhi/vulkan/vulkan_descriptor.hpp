#pragma once

#include "kiln/rhi/rhi_descriptor.hpp"
#include <vulkan/vulkan.hpp>

namespace kiln::renderer::rhi::vulkan
{
    class VulkanRHIDevice;

    class VulkanRHIDescriptorSetLayout : public RHIDescriptorSetLayout
    {
    public:
        VulkanRHIDescriptorSetLayout(VulkanRHIDevice* device,
                                     vk::DescriptorSetLayout layout,
                                     const DescriptorSetLayout& desc);
        ~VulkanRHIDescriptorSetLayout() override;

        VulkanRHIDescriptorSetLayout(const VulkanRHIDescriptorSetLayout&) = delete;
        VulkanRHIDescriptorSetLayout& operator=(const VulkanRHIDescriptorSetLayout&) = delete;

        void* nativeHandle() const override { return static_cast<VkDescriptorSetLayout>(m_layout); }
        const DescriptorSetLayout& description() const override { return m_desc; }

        vk::DescriptorSetLayout layout() const { return m_layout; }
        const DescriptorBinding* binding(uint32_t binding) const { return m_desc.find(binding); }

    private:
        VulkanRHIDevice* m_device;
        vk::DescriptorSetLayout m_layout;
        DescriptorSetLayout m_desc;
    };

    class VulkanRHIDescriptorSet : public RHIDescriptorSet
    {
    public:
        VulkanRHIDescriptorSet(VulkanRHIDevice* device,
                               VulkanRHIDescriptorSetLayout* layout,
                               vk::DescriptorSet set);
        ~VulkanRHIDescriptorSet() override;

        VulkanRHIDescriptorSet(const VulkanRHIDescriptorSet&) = delete;
        VulkanRHIDescriptorSet& operator=(const VulkanRHIDescriptorSet&) = delete;

        void updateBuffer(uint32_t binding,
                          RHIBuffer* buffer,
                          uint64_t offset,
                          uint64_t range) override;
        void updateTexture(uint32_t binding,
                           RHITexture* texture,
                           RHISampler* sampler) override;

        RHIDescriptorSetLayout* layout() const override { return m_layout; }
        void* nativeHandle() const override { return static_cast<VkDescriptorSet>(m_set); }

    private:
        VulkanRHIDevice* m_device;
        VulkanRHIDescriptorSetLayout* m_layout;
        vk::DescriptorSet m_set;
    };
}
