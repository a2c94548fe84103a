#include "kiln/rhi/vulkan/vulkan_sampler.hpp"

#include "kiln/rhi/vulkan/vulkan_device.hpp"
#include "kiln/rhi/vulkan/vulkan_utils.hpp"

namespace kiln::renderer::rhi::vulkan
{
    VulkanRHISampler::VulkanRHISampler(VulkanRHIDevice* device, const SamplerDescriptor& desc)
        : m_device(device)
        , m_desc(desc)
    {
        const bool compare = desc.compareOp != CompareOp::None;

        vk::SamplerCreateInfo samplerInfo{};
        samplerInfo.magFilter = VulkanUtils::toVkFilter(desc.magFilter);
        samplerInfo.minFilter = VulkanUtils::toVkFilter(desc.minFilter);
        samplerInfo.addressModeU = VulkanUtils::toVkAddressMode(desc.addressMode);
        samplerInfo.addressModeV = VulkanUtils::toVkAddressMode(desc.addressMode);
        samplerInfo.addressModeW = VulkanUtils::toVkAddressMode(desc.addressMode);

        samplerInfo.anisotropyEnable = VK_FALSE;
        samplerInfo.maxAnisotropy = 1.0F;
        samplerInfo.borderColor = vk::BorderColor::eIntOpaqueBlack;
        samplerInfo.unnormalizedCoordinates = VK_FALSE;

        samplerInfo.compareEnable = compare ? VK_TRUE : VK_FALSE;
        samplerInfo.compareOp = VulkanUtils::toVkCompareOp(desc.compareOp);

        samplerInfo.mipmapMode = desc.minFilter == Filter::Linear
            ? vk::SamplerMipmapMode::eLinear
            : vk::SamplerMipmapMode::eNearest;
        samplerInfo.mipLodBias = 0.0F;
        samplerInfo.minLod = 0.0F;
        samplerInfo.maxLod = VK_LOD_CLAMP_NONE;

        m_sampler = m_device->device().createSampler(samplerInfo);
    }

    VulkanRHISampler::~VulkanRHISampler()
    {
        if (m_sampler) {
            m_device->device().destroySampler(m_sampler);
        }
    }

} // namespace kiln::renderer::rhi::vulkan
