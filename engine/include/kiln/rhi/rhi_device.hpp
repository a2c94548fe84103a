#pragma once

#include "rhi_types.hpp"
#include "rhi_buffer.hpp"
#include "rhi_texture.hpp"
#include "rhi_sampler.hpp"
#include "rhi_descriptor.hpp"
#include <memory>
#include <string>

namespace kiln::renderer::rhi
{
    // Abstract logical device: the GPU resource factory the scene pipeline talks to
    class RHIDevice
    {
    public:
        virtual ~RHIDevice() = default;

        // Resource creation
        virtual std::unique_ptr<RHIBuffer> createBuffer(const BufferDescriptor& desc) = 0;

        virtual std::unique_ptr<RHITexture> createTexture(const TextureDescriptor& desc) = 0;

        virtual std::unique_ptr<RHISampler> createSampler(const SamplerDescriptor& desc) = 0;

        // Descriptor sets/layouts
        virtual std::unique_ptr<RHIDescriptorSetLayout> createDescriptorSetLayout(
            const DescriptorSetLayout& desc) = 0;
        virtual std::unique_ptr<RHIDescriptorSet> allocateDescriptorSet(
            RHIDescriptorSetLayout* layout) = 0;

        // Synchronization
        virtual void waitIdle() = 0;

        // Device queries
        virtual RHIBackend backend() const = 0;
        virtual const std::string& name() const = 0;
    };

} // namespace kiln::renderer::rhi
