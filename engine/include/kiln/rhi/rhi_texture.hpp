#pragma once

#include "rhi_types.hpp"
#include <cstddef>
#include <span>

namespace kiln::renderer::rhi
{
    enum class TextureType
    {
        Texture2D
    };

    struct TextureDescriptor
    {
        TextureType type = TextureType::Texture2D;
        Extent3D extent;
        Format format = Format::Undefined;
        TextureUsage usage = TextureUsage::None;
        uint32_t mipLevels = 1;
        uint32_t arrayLayers = 1;
        const char* debugName = nullptr;
    };

    struct TextureSubresource
    {
        uint32_t mipLevel = 0;
        uint32_t arrayLayer = 0;
    };

    class RHITexture
    {
    public:
        virtual ~RHITexture() = default;

        // Upload texel data for one subresource (tightly packed rows)
        virtual void uploadData(
            std::span<const std::byte> data,
            const TextureSubresource& subresource = {}) = 0;

        // Getters
        virtual const Extent3D& extent() const = 0;
        virtual Format format() const = 0;
        virtual uint32_t mipLevels() const = 0;
        virtual uint32_t arrayLayers() const = 0;
        virtual TextureUsage usage() const = 0;

        // Backend-specific handle
        virtual void* nativeHandle() const = 0;
        virtual void* nativeView() const = 0;  // Image view
    };

} // namespace kiln::renderer::rhi
