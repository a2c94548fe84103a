#pragma once

#include "kiln/rhi/rhi_sampler.hpp"
#include <vulkan/vulkan.hpp>

namespace kiln::renderer::rhi::vulkan
{
    class VulkanRHIDevice;

    class VulkanRHISampler : public RHISampler
    {
    public:
        VulkanRHISampler(VulkanRHIDevice* device, const SamplerDescriptor& desc);
        ~VulkanRHISampler() override;

        VulkanRHISampler(const VulkanRHISampler&) = delete;
        VulkanRHISampler& operator=(const VulkanRHISampler&) = delete;

        const SamplerDescriptor& description() const override { return m_desc; }
        void* nativeHandle() const override { return static_cast<VkSampler>(m_sampler); }

        vk::Sampler sampler() const { return m_sampler; }

    private:
        VulkanRHIDevice* m_device;
        SamplerDescriptor m_desc;
        vk::Sampler m_sampler;
    };
}
