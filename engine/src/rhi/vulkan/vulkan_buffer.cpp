#include "kiln/rhi/vulkan/vulkan_buffer.hpp"

#include "kiln/core/logger.hpp"
#include "kiln/core/common.hpp"
#include "kiln/rhi/vulkan/vulkan_device.hpp"
#include "kiln/rhi/vulkan/vulkan_utils.hpp"
#include <cpptrace/cpptrace.hpp>
#include <cstring>

using namespace kiln::util;

namespace kiln::renderer::rhi::vulkan
{
    VulkanRHIBuffer::VulkanRHIBuffer(VulkanRHIDevice* device,
                                     const BufferDescriptor& desc)
        : m_device(device)
        , m_size(desc.size)
        , m_usage(desc.usage)
        , m_memoryUsage(desc.memoryUsage)
    {
        vk::BufferCreateInfo bufferInfo{};
        bufferInfo.size = desc.size;
        bufferInfo.usage = VulkanUtils::toVkBufferUsage(desc.usage);
        bufferInfo.sharingMode = vk::SharingMode::eExclusive;

        VmaAllocationCreateInfo allocInfo{};
        allocInfo.usage = VulkanUtils::toVmaMemoryUsage(desc.memoryUsage);
        if (desc.memoryUsage == MemoryUsage::CPUToGPU || desc.memoryUsage == MemoryUsage::CPUOnly)
        {
            allocInfo.flags =
                VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT |
                VMA_ALLOCATION_CREATE_MAPPED_BIT;
        }

        // VMA still uses C types, need to convert
        auto cBufferInfo = static_cast<VkBufferCreateInfo>(bufferInfo);
        VkBuffer cBuffer = nullptr;
        VmaAllocationInfo ainfo{};

        auto result = static_cast<vk::Result>(
            vmaCreateBuffer(m_device->allocator(), &cBufferInfo, &allocInfo,
                          &cBuffer, &m_allocation, &ainfo));

        if (result != vk::Result::eSuccess) {
            core::Logger::RHI.error("Failed to create buffer '{}' ({} bytes): {}",
                                    desc.debugName != nullptr ? desc.debugName : "<unnamed>",
                                    desc.size, vk::to_string(result));
            throw cpptrace::runtime_error("Buffer creation failed");
        }

        m_buffer = cBuffer;

        if (ainfo.pMappedData != nullptr)
        {
            m_mappedData = static_cast<std::byte*>(ainfo.pMappedData);
            m_isPersistentlyMapped = true;
        }

        if (desc.debugName != nullptr) {
            vk::DebugUtilsObjectNameInfoEXT nameInfo{};
            nameInfo.objectType = vk::ObjectType::eBuffer;
            nameInfo.objectHandle = u64(static_cast<VkBuffer>(m_buffer));
            nameInfo.pObjectName = desc.debugName;

            if (VULKAN_HPP_DEFAULT_DISPATCHER.vkSetDebugUtilsObjectNameEXT != nullptr) {
                m_device->device().setDebugUtilsObjectNameEXT(nameInfo);
            }
        }

        core::Logger::RHI.trace("VulkanRHIBuffer created: {} (size: {})",
                                desc.debugName != nullptr ? desc.debugName : "<unnamed>", m_size);
    }

    VulkanRHIBuffer::~VulkanRHIBuffer()
    {
        if (!m_isPersistentlyMapped && m_mappedData != nullptr) {
            unmap();
        }
        vmaDestroyBuffer(m_device->allocator(), m_buffer, m_allocation);
    }

    std::byte* VulkanRHIBuffer::map()
    {
        if (m_mappedData != nullptr) {
            return m_mappedData;
        }

        void* mapped = nullptr;
        auto result = static_cast<vk::Result>(
            vmaMapMemory(m_device->allocator(), m_allocation, &mapped));

        if (result != vk::Result::eSuccess) {
            core::Logger::RHI.error("Failed to map buffer memory: {}", vk::to_string(result));
            return nullptr;
        }

        m_mappedData = static_cast<std::byte*>(mapped);
        return m_mappedData;
    }

    void VulkanRHIBuffer::unmap()
    {
        if (m_isPersistentlyMapped) {
            return;
        }
        if (m_mappedData != nullptr) {
            vmaUnmapMemory(m_device->allocator(), m_allocation);
            m_mappedData = nullptr;
        }
    }

    void VulkanRHIBuffer::uploadData(std::span<const std::byte> data, uint64_t offset)
    {
        if (offset + data.size() > m_size) {
            core::Logger::RHI.error("uploadData out of bounds: offset={} size={} bufSize={}", offset, data.size(), m_size);
            return;
        }

        if (m_memoryUsage == MemoryUsage::GPUOnly) {
            // Device-local memory is not host visible; go through a staging copy
            BufferDescriptor stagingDesc{};
            stagingDesc.size = data.size();
            stagingDesc.usage = BufferUsage::TransferSrc;
            stagingDesc.memoryUsage = MemoryUsage::CPUOnly;
            stagingDesc.debugName = "BufferUploadStaging";
            VulkanRHIBuffer staging(m_device, stagingDesc);
            staging.uploadData(data, 0);

            m_device->immediateSubmit([&](vk::CommandBuffer cmd) {
                vk::BufferCopy region{};
                region.srcOffset = 0;
                region.dstOffset = offset;
                region.size = data.size();
                cmd.copyBuffer(staging.buffer(), m_buffer, region);
            });
            return;
        }

        std::byte* mapped = map();
        if (mapped == nullptr) {
            throw cpptrace::runtime_error("Failed to map buffer for upload");
        }

        std::memcpy(mapped + offset, data.data(), data.size());
        vmaFlushAllocation(m_device->allocator(), m_allocation, offset, data.size());
        unmap();
    }
} // namespace kiln::renderer::rhi::vulkan
