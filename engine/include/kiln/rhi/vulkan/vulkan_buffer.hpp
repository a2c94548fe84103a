#pragma once

#include "kiln/rhi/rhi_buffer.hpp"
#include <vulkan/vulkan.hpp>
#include <vk_mem_alloc.h>
#include <span>
#include <cstddef>

namespace kiln::renderer::rhi::vulkan
{
    class VulkanRHIDevice;

    class VulkanRHIBuffer : public RHIBuffer
    {
    public:
        VulkanRHIBuffer(VulkanRHIDevice* device,
                        const BufferDescriptor& desc);
        ~VulkanRHIBuffer() override;

        VulkanRHIBuffer(const VulkanRHIBuffer&) = delete;
        VulkanRHIBuffer& operator=(const VulkanRHIBuffer&) = delete;

        std::byte* map() override;
        void unmap() override;
        void uploadData(std::span<const std::byte> data, uint64_t offset = 0) override;

        uint64_t size() const override { return m_size; }
        BufferUsage usage() const override { return m_usage; }
        MemoryUsage memoryUsage() const override { return m_memoryUsage; }

        void* nativeHandle() const override { return static_cast<VkBuffer>(m_buffer); }

        vk::Buffer buffer() const { return m_buffer; }
        VmaAllocation allocation() const { return m_allocation; }

    private:
        VulkanRHIDevice* m_device;
        vk::Buffer m_buffer;
        VmaAllocation m_allocation{};
        uint64_t m_size;
        BufferUsage m_usage;
        MemoryUsage m_memoryUsage;
        std::byte* m_mappedData = nullptr;
        bool m_isPersistentlyMapped = false;
    };

}
