#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <type_traits>

namespace kiln::renderer::rhi
{
    // Backend selection
    enum class RHIBackend
    {
        Vulkan,
        Null // CPU-side storage, no GPU (tests, headless tools)
    };

    // Helper for enum class flag operations
    template<typename T>
    requires std::is_enum_v<T>
    constexpr bool hasFlag(T value, T flag) {
        return (static_cast<std::underlying_type_t<T>>(value) &
                static_cast<std::underlying_type_t<T>>(flag)) != 0;
    }

    // Resource formats (map to VkFormat)
    enum class Format
    {
        Undefined,

        // Color formats
        R8G8B8A8_UNORM,
        R8G8B8A8_SRGB,
        B8G8R8A8_UNORM,
        B8G8R8A8_SRGB,

        R32G32_SFLOAT,
        R32G32B32_SFLOAT,
        R32G32B32A32_SFLOAT,
        R32G32B32A32_UINT
    };

    // Bytes per texel for uncompressed formats, 0 for Undefined
    constexpr uint32_t bytesPerTexel(Format format)
    {
        switch (format)
        {
        case Format::R8G8B8A8_UNORM:
        case Format::R8G8B8A8_SRGB:
        case Format::B8G8R8A8_UNORM:
        case Format::B8G8R8A8_SRGB: return 4;
        case Format::R32G32_SFLOAT: return 8;
        case Format::R32G32B32_SFLOAT: return 12;
        case Format::R32G32B32A32_SFLOAT:
        case Format::R32G32B32A32_UINT: return 16;
        case Format::Undefined: return 0;
        }
        return 0;
    }

    // Buffer usage flags
    enum class BufferUsage : uint32_t
    {
        None = 0,
        TransferSrc = 1 << 0,
        TransferDst = 1 << 1,
        UniformBuffer = 1 << 2,
        StorageBuffer = 1 << 3,
        IndexBuffer = 1 << 4,
        VertexBuffer = 1 << 5
    };

    // Texture usage flags
    enum class TextureUsage : uint32_t
    {
        None = 0,
        TransferSrc = 1 << 0,
        TransferDst = 1 << 1,
        Sampled = 1 << 2,
        Storage = 1 << 3
    };

    // Memory properties
    enum class MemoryUsage
    {
        GPUOnly, // Device local (VRAM)
        CPUToGPU, // Upload heap
        GPUToCPU, // Readback heap
        CPUOnly // Staging
    };

    // Shader stages
    enum class ShaderStage : uint32_t
    {
        None = 0,
        Vertex = 1 << 0,
        Fragment = 1 << 1,
        Compute = 1 << 2,
        All = Vertex | Fragment | Compute
    };

    // Index element width of a staged index buffer
    enum class IndexFormat
    {
        Uint16,
        Uint32
    };

    constexpr uint32_t indexSize(IndexFormat format)
    {
        return format == IndexFormat::Uint16 ? 2U : 4U;
    }

    // Compare operations
    enum class CompareOp
    {
        None,
        Never,
        Less,
        Equal,
        LessOrEqual,
        Greater,
        NotEqual,
        GreaterOrEqual,
        Always
    };

    // Texture filters
    enum class Filter
    {
        Nearest,
        Linear
    };

    // Sampler address modes
    enum class SamplerAddressMode
    {
        Repeat,
        MirroredRepeat,
        ClampToEdge,
        ClampToBorder
    };

    // Descriptor types
    enum class DescriptorType
    {
        Sampler,
        CombinedImageSampler, // Texture + Sampler
        SampledImage,         // Texture without sampler (Separate)
        StorageImage,         // RWTexture / image2D
        UniformBuffer,        // UBO / cbuffer
        StorageBuffer         // SSBO / StructuredBuffer
    };

    constexpr bool isImageDescriptor(DescriptorType type)
    {
        return type == DescriptorType::Sampler ||
               type == DescriptorType::CombinedImageSampler ||
               type == DescriptorType::SampledImage ||
               type == DescriptorType::StorageImage;
    }

    struct Extent3D
    {
        uint32_t width = 0;
        uint32_t height = 0;
        uint32_t depth = 1;
    };

    // Descriptor set layout binding
    struct DescriptorBinding
    {
        uint32_t binding;
        DescriptorType type;
        uint32_t count = 1;
        ShaderStage stages;
    };

    struct DescriptorSetLayout
    {
        std::vector<DescriptorBinding> bindings;

        const DescriptorBinding* find(uint32_t binding) const
        {
            for (const auto& b : bindings)
            {
                if (b.binding == binding)
                {
                    return &b;
                }
            }
            return nullptr;
        }
    };

    // Operator overloads for flags
    inline BufferUsage operator|(BufferUsage a, BufferUsage b)
    {
        return static_cast<BufferUsage>(
            static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
    }

    inline BufferUsage operator&(BufferUsage a, BufferUsage b)
    {
        return static_cast<BufferUsage>(
            static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
    }

    inline BufferUsage& operator|=(BufferUsage& a, BufferUsage b)
    {
        a = a | b;
        return a;
    }

    inline TextureUsage operator|(TextureUsage a, TextureUsage b)
    {
        return static_cast<TextureUsage>(
            static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
    }

    inline TextureUsage operator&(TextureUsage a, TextureUsage b)
    {
        return static_cast<TextureUsage>(
            static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
    }

    inline TextureUsage& operator|=(TextureUsage& a, TextureUsage b)
    {
        a = a | b;
        return a;
    }

    inline ShaderStage operator|(ShaderStage a, ShaderStage b)
    {
        return static_cast<ShaderStage>(
            static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
    }

    inline ShaderStage operator&(ShaderStage a, ShaderStage b)
    {
        return static_cast<ShaderStage>(
            static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
    }
} // namespace kiln::renderer::rhi
