#pragma once

#include "rhi_types.hpp"

namespace kiln::renderer::rhi
{
    struct SamplerDescriptor
    {
        Filter minFilter = Filter::Linear;
        Filter magFilter = Filter::Linear;
        SamplerAddressMode addressMode = SamplerAddressMode::Repeat;
        CompareOp compareOp = CompareOp::None;
    };

    class RHISampler
    {
    public:
        virtual ~RHISampler() = default;

        virtual const SamplerDescriptor& description() const = 0;

        // Backend-specific handle
        virtual void* nativeHandle() const = 0;
    };

} // namespace kiln::renderer::rhi
