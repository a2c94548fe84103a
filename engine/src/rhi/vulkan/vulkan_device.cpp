#include "kiln/rhi/vulkan/vulkan_device.hpp"

#include "kiln/core/common.hpp"
#include "kiln/core/logger.hpp"
#include "kiln/rhi/vulkan/vulkan_buffer.hpp"
#include "kiln/rhi/vulkan/vulkan_descriptor.hpp"
#include "kiln/rhi/vulkan/vulkan_sampler.hpp"
#include "kiln/rhi/vulkan/vulkan_texture.hpp"
#include "kiln/rhi/vulkan/vulkan_utils.hpp"
#include <array>
#include <cpptrace/cpptrace.hpp>

namespace kiln::renderer::rhi::vulkan
{
    namespace
    {
        constexpr uint32_t kMaxDescriptorSets = 1024;
    }

    VulkanRHIDevice::VulkanRHIDevice(const VulkanDeviceContext& context)
        : m_context(context)
    {
        if (!m_context.instance || !m_context.physicalDevice || !m_context.device || !m_context.queue)
        {
            throw cpptrace::logic_error("VulkanRHIDevice requires instance, physical device, device and queue");
        }

        initDispatcher();

        auto properties = m_context.physicalDevice.getProperties();
        m_name = properties.deviceName.data();

        createAllocator();
        createCommandPool();
        createDescriptorPool();

        core::Logger::RHI.info("Vulkan device adopted: {} (queue family {})", m_name, m_context.queueFamily);
    }

    VulkanRHIDevice::~VulkanRHIDevice()
    {
        m_context.device.waitIdle();

        if (m_descriptorPool) {
            m_context.device.destroyDescriptorPool(m_descriptorPool);
        }
        if (m_commandPool) {
            m_context.device.destroyCommandPool(m_commandPool);
        }
        if (m_allocator != nullptr) {
            vmaDestroyAllocator(m_allocator);
        }

        core::Logger::RHI.trace("VulkanRHIDevice destroyed");
    }

    void VulkanRHIDevice::initDispatcher()
    {
        PFN_vkGetInstanceProcAddr getInstanceProcAddr = m_context.getInstanceProcAddr;
        if (getInstanceProcAddr == nullptr)
        {
            m_loader = std::make_unique<vk::detail::DynamicLoader>();
            getInstanceProcAddr = m_loader->getProcAddress<PFN_vkGetInstanceProcAddr>("vkGetInstanceProcAddr");
            if (getInstanceProcAddr == nullptr)
            {
                throw cpptrace::runtime_error("Failed to load vkGetInstanceProcAddr");
            }
        }

        VULKAN_HPP_DEFAULT_DISPATCHER.init(getInstanceProcAddr);
        VULKAN_HPP_DEFAULT_DISPATCHER.init(m_context.instance);
        VULKAN_HPP_DEFAULT_DISPATCHER.init(m_context.device);
    }

    void VulkanRHIDevice::createAllocator()
    {
        VmaVulkanFunctions funcs{};
        funcs.vkGetInstanceProcAddr = VULKAN_HPP_DEFAULT_DISPATCHER.vkGetInstanceProcAddr;
        funcs.vkGetDeviceProcAddr = VULKAN_HPP_DEFAULT_DISPATCHER.vkGetDeviceProcAddr;

        VmaAllocatorCreateInfo allocatorInfo{};
        allocatorInfo.vulkanApiVersion = VK_API_VERSION_1_3;
        allocatorInfo.physicalDevice = m_context.physicalDevice;
        allocatorInfo.device = m_context.device;
        allocatorInfo.instance = m_context.instance;
        allocatorInfo.pVulkanFunctions = &funcs;

        auto result = static_cast<vk::Result>(vmaCreateAllocator(&allocatorInfo, &m_allocator));
        if (result != vk::Result::eSuccess)
        {
            throw cpptrace::runtime_error("Failed to create VMA allocator: " + vk::to_string(result));
        }
    }

    void VulkanRHIDevice::createCommandPool()
    {
        vk::CommandPoolCreateInfo poolInfo{};
        poolInfo.queueFamilyIndex = m_context.queueFamily;
        poolInfo.flags = vk::CommandPoolCreateFlagBits::eTransient |
                         vk::CommandPoolCreateFlagBits::eResetCommandBuffer;

        m_commandPool = m_context.device.createCommandPool(poolInfo);
    }

    void VulkanRHIDevice::createDescriptorPool()
    {
        std::array<vk::DescriptorPoolSize, 5> poolSizes = {{
            {vk::DescriptorType::eSampler, kMaxDescriptorSets},
            {vk::DescriptorType::eSampledImage, kMaxDescriptorSets},
            {vk::DescriptorType::eCombinedImageSampler, kMaxDescriptorSets},
            {vk::DescriptorType::eUniformBuffer, kMaxDescriptorSets / 4},
            {vk::DescriptorType::eStorageBuffer, kMaxDescriptorSets / 4},
        }};

        vk::DescriptorPoolCreateInfo poolInfo{};
        poolInfo.flags = vk::DescriptorPoolCreateFlagBits::eFreeDescriptorSet;
        poolInfo.maxSets = kMaxDescriptorSets;
        poolInfo.poolSizeCount = util::u32(poolSizes.size());
        poolInfo.pPoolSizes = poolSizes.data();

        m_descriptorPool = m_context.device.createDescriptorPool(poolInfo);
    }

    std::unique_ptr<RHIBuffer> VulkanRHIDevice::createBuffer(const BufferDescriptor& desc)
    {
        auto buffer = std::make_unique<VulkanRHIBuffer>(this, desc);
        if (!desc.data.empty())
        {
            buffer->uploadData(desc.data, 0);
        }
        return buffer;
    }

    std::unique_ptr<RHITexture> VulkanRHIDevice::createTexture(const TextureDescriptor& desc)
    {
        return std::make_unique<VulkanRHITexture>(this, desc);
    }

    std::unique_ptr<RHISampler> VulkanRHIDevice::createSampler(const SamplerDescriptor& desc)
    {
        return std::make_unique<VulkanRHISampler>(this, desc);
    }

    std::unique_ptr<RHIDescriptorSetLayout> VulkanRHIDevice::createDescriptorSetLayout(
        const DescriptorSetLayout& desc)
    {
        std::vector<vk::DescriptorSetLayoutBinding> bindings;
        bindings.reserve(desc.bindings.size());
        for (const auto& binding : desc.bindings)
        {
            vk::DescriptorSetLayoutBinding vkBinding{};
            vkBinding.binding = binding.binding;
            vkBinding.descriptorType = VulkanUtils::toVkDescriptorType(binding.type);
            vkBinding.descriptorCount = binding.count;
            vkBinding.stageFlags = VulkanUtils::toVkShaderStage(binding.stages);
            bindings.push_back(vkBinding);
        }

        vk::DescriptorSetLayoutCreateInfo layoutInfo{};
        layoutInfo.bindingCount = util::u32(bindings.size());
        layoutInfo.pBindings = bindings.data();

        vk::DescriptorSetLayout layout = m_context.device.createDescriptorSetLayout(layoutInfo);
        return std::make_unique<VulkanRHIDescriptorSetLayout>(this, layout, desc);
    }

    std::unique_ptr<RHIDescriptorSet> VulkanRHIDevice::allocateDescriptorSet(
        RHIDescriptorSetLayout* layout)
    {
        auto* vkLayout = dynamic_cast<VulkanRHIDescriptorSetLayout*>(layout);
        if (vkLayout == nullptr)
        {
            throw cpptrace::logic_error("allocateDescriptorSet: layout does not belong to the Vulkan backend");
        }

        vk::DescriptorSetLayout nativeLayout = vkLayout->layout();
        vk::DescriptorSetAllocateInfo allocInfo{};
        allocInfo.descriptorPool = m_descriptorPool;
        allocInfo.descriptorSetCount = 1;
        allocInfo.pSetLayouts = &nativeLayout;

        vk::DescriptorSet set;
        VulkanUtils::checkVkResult(m_context.device.allocateDescriptorSets(&allocInfo, &set),
                                   "vkAllocateDescriptorSets");

        return std::make_unique<VulkanRHIDescriptorSet>(this, vkLayout, set);
    }

    void VulkanRHIDevice::waitIdle()
    {
        m_context.device.waitIdle();
    }

    void VulkanRHIDevice::immediateSubmit(const std::function<void(vk::CommandBuffer)>& func)
    {
        vk::CommandBufferAllocateInfo allocInfo{};
        allocInfo.commandPool = m_commandPool;
        allocInfo.level = vk::CommandBufferLevel::ePrimary;
        allocInfo.commandBufferCount = 1;

        vk::CommandBuffer cmd = m_context.device.allocateCommandBuffers(allocInfo).front();
        auto guard = util::makeScopeGuard([&] { m_context.device.freeCommandBuffers(m_commandPool, cmd); });

        vk::CommandBufferBeginInfo beginInfo{};
        beginInfo.flags = vk::CommandBufferUsageFlagBits::eOneTimeSubmit;
        cmd.begin(beginInfo);
        func(cmd);
        cmd.end();

        vk::SubmitInfo submitInfo{};
        submitInfo.commandBufferCount = 1;
        submitInfo.pCommandBuffers = &cmd;
        m_context.queue.submit(submitInfo, nullptr);
        m_context.queue.waitIdle();
    }
}
