#include "kiln/renderer/RenderContext.hpp"

#include "kiln/core/logger.hpp"

namespace kiln::renderer {

    RenderContext::RenderContext(rhi::RHIDevice& device)
        : m_device(device)
    {
        rhi::SamplerDescriptor samplerDesc{};
        samplerDesc.minFilter = rhi::Filter::Linear;
        samplerDesc.magFilter = rhi::Filter::Linear;
        samplerDesc.addressMode = rhi::SamplerAddressMode::Repeat;
        m_sampler = m_device.createSampler(samplerDesc);

        rhi::DescriptorSetLayout layout{};
        layout.bindings = {
            {kColorTextureBinding, rhi::DescriptorType::SampledImage, 1, rhi::ShaderStage::Fragment},
            {kColorSamplerBinding, rhi::DescriptorType::Sampler, 1, rhi::ShaderStage::Fragment},
        };
        m_colorLayout = m_device.createDescriptorSetLayout(layout);

        core::Logger::Render.debug("RenderContext created on '{}'", m_device.name());
    }

    std::unique_ptr<rhi::RHIDescriptorSet> RenderContext::createColorBindGroup(rhi::RHITexture& texture) const
    {
        auto set = m_device.allocateDescriptorSet(m_colorLayout.get());
        set->updateTexture(kColorTextureBinding, &texture, nullptr);
        set->updateTexture(kColorSamplerBinding, nullptr, m_sampler.get());
        return set;
    }

}
