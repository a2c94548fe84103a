#pragma once

#include "kiln/rhi/rhi_device.hpp"
#include <memory>

namespace kiln::renderer {

    // Long-lived objects shared by every loaded pack: the device, the texture
    // sampler and the color-texture bind group layout. Outlives all packs.
    class RenderContext {
    public:
        static constexpr uint32_t kColorTextureBinding = 0;
        static constexpr uint32_t kColorSamplerBinding = 1;

        explicit RenderContext(rhi::RHIDevice& device);

        RenderContext(const RenderContext&) = delete;
        RenderContext& operator=(const RenderContext&) = delete;

        rhi::RHIDevice& device() const { return m_device; }
        rhi::RHISampler& textureSampler() const { return *m_sampler; }
        rhi::RHIDescriptorSetLayout& colorTextureLayout() const { return *m_colorLayout; }

        // One descriptor set binding texture with the shared sampler
        std::unique_ptr<rhi::RHIDescriptorSet> createColorBindGroup(rhi::RHITexture& texture) const;

    private:
        rhi::RHIDevice& m_device;
        std::unique_ptr<rhi::RHISampler> m_sampler;
        std::unique_ptr<rhi::RHIDescriptorSetLayout> m_colorLayout;
    };

}
