#pragma once

#include "kiln/rhi/rhi_device.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vulkan/vulkan.hpp>
#include <vk_mem_alloc.h>

namespace kiln::renderer::rhi::vulkan
{
    // Handles created by the windowing/presentation layer; the device adopts them
    // without taking ownership of instance, physical device or device. The device
    // must be Vulkan 1.3 with synchronization2 enabled. Without getInstanceProcAddr
    // the Vulkan loader library is opened at adoption.
    struct VulkanDeviceContext
    {
        vk::Instance instance;
        vk::PhysicalDevice physicalDevice;
        vk::Device device;
        vk::Queue queue;
        uint32_t queueFamily = 0;
        PFN_vkGetInstanceProcAddr getInstanceProcAddr = nullptr;
    };

    class VulkanRHIDevice : public RHIDevice
    {
    public:
        explicit VulkanRHIDevice(const VulkanDeviceContext& context);
        ~VulkanRHIDevice() override;

        // Disable copy
        VulkanRHIDevice(const VulkanRHIDevice&) = delete;
        VulkanRHIDevice& operator=(const VulkanRHIDevice&) = delete;

        // RHIDevice interface - Resource creation
        std::unique_ptr<RHIBuffer> createBuffer(const BufferDescriptor& desc) override;
        std::unique_ptr<RHITexture> createTexture(const TextureDescriptor& desc) override;
        std::unique_ptr<RHISampler> createSampler(const SamplerDescriptor& desc) override;

        std::unique_ptr<RHIDescriptorSetLayout> createDescriptorSetLayout(
            const DescriptorSetLayout& desc) override;
        std::unique_ptr<RHIDescriptorSet> allocateDescriptorSet(
            RHIDescriptorSetLayout* layout) override;

        // Synchronization
        void waitIdle() override;

        RHIBackend backend() const override { return RHIBackend::Vulkan; }
        const std::string& name() const override { return m_name; }

        // Records func into a one-shot command buffer, submits and waits for the queue
        void immediateSubmit(const std::function<void(vk::CommandBuffer)>& func);

        // Vulkan-specific accessors
        vk::Device device() const { return m_context.device; }
        vk::Instance instance() const { return m_context.instance; }
        vk::PhysicalDevice vkPhysicalDevice() const { return m_context.physicalDevice; }
        vk::Queue queue() const { return m_context.queue; }
        VmaAllocator allocator() const { return m_allocator; }
        vk::DescriptorPool descriptorPool() const { return m_descriptorPool; }

    private:
        void initDispatcher();
        void createAllocator();
        void createCommandPool();
        void createDescriptorPool();

        VulkanDeviceContext m_context;
        std::unique_ptr<vk::detail::DynamicLoader> m_loader;
        std::string m_name;
        VmaAllocator m_allocator = nullptr;
        vk::CommandPool m_commandPool;
        vk::DescriptorPool m_descriptorPool;
    };
}
