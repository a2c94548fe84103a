#pragma once

#include "rhi_types.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace kiln::renderer::rhi
{
    struct BufferDescriptor
    {
        uint64_t size = 0;
        BufferUsage usage = BufferUsage::None;
        MemoryUsage memoryUsage = MemoryUsage::GPUOnly;
        std::span<const std::byte> data; // Optional initial contents, copied at creation
        const char* debugName = nullptr;
    };

    class RHIBuffer
    {
    public:
        virtual ~RHIBuffer() = default;

        // Map/unmap for CPU access (host-visible memory only)
        virtual std::byte* map() = 0;
        virtual void unmap() = 0;

        // Upload data (convenience for map/memcpy/unmap)
        virtual void uploadData(std::span<const std::byte> data, uint64_t offset = 0) = 0;

        // Getters
        virtual uint64_t size() const = 0;
        virtual BufferUsage usage() const = 0;
        virtual MemoryUsage memoryUsage() const = 0;

        // Backend-specific handle (for interop)
        virtual void* nativeHandle() const = 0;
    };

} // namespace kiln::renderer::rhi
