#include "VulkanTestContext.hpp"

#include <stdexcept>
#include <vector>

namespace kiln::tests {

VulkanTestContext::VulkanTestContext() = default;

VulkanTestContext::~VulkanTestContext() {
  if (m_isSetup) {
    teardown();
  }
}

bool VulkanTestContext::createInstance() {
  try {
    m_loader = std::make_unique<vk::detail::DynamicLoader>();
  } catch (const std::runtime_error &e) {
    core::Logger::RHI.warn("Vulkan loader not available: {}", e.what());
    return false;
  }

  m_getInstanceProcAddr =
      m_loader->getProcAddress<PFN_vkGetInstanceProcAddr>("vkGetInstanceProcAddr");
  if (m_getInstanceProcAddr == nullptr) {
    core::Logger::RHI.warn("Failed to load vkGetInstanceProcAddr for Vulkan tests");
    return false;
  }

  VULKAN_HPP_DEFAULT_DISPATCHER.init(m_getInstanceProcAddr);

  if (vk::enumerateInstanceVersion() < VK_API_VERSION_1_3) {
    core::Logger::RHI.warn("Vulkan loader is older than 1.3");
    return false;
  }

  vk::ApplicationInfo appInfo{};
  appInfo.pApplicationName = "kiln tests";
  appInfo.applicationVersion = VK_MAKE_VERSION(1, 0, 0);
  appInfo.pEngineName = "kiln";
  appInfo.engineVersion = VK_MAKE_VERSION(1, 0, 0);
  appInfo.apiVersion = VK_API_VERSION_1_3;

  std::vector<const char *> extensions;
#ifdef __APPLE__
  extensions.push_back(VK_KHR_PORTABILITY_ENUMERATION_EXTENSION_NAME);
#endif

  vk::InstanceCreateInfo createInfo{};
  createInfo.pApplicationInfo = &appInfo;
  createInfo.enabledExtensionCount = static_cast<uint32_t>(extensions.size());
  createInfo.ppEnabledExtensionNames = extensions.data();
#ifdef __APPLE__
  createInfo.flags |= vk::InstanceCreateFlagBits::eEnumeratePortabilityKHR;
#endif

  try {
    m_instance = vk::createInstance(createInfo);
  } catch (const vk::SystemError &e) {
    core::Logger::RHI.warn("Failed to create Vulkan instance: {}", e.what());
    return false;
  }

  VULKAN_HPP_DEFAULT_DISPATCHER.init(m_instance);
  return true;
}

bool VulkanTestContext::selectPhysicalDevice() {
  for (const auto &pd : m_instance.enumeratePhysicalDevices()) {
    const auto props = pd.getProperties();
    if (props.apiVersion < VK_API_VERSION_1_3) {
      continue;
    }

    const auto families = pd.getQueueFamilyProperties();
    for (uint32_t i = 0; i < families.size(); ++i) {
      if (families[i].queueFlags & vk::QueueFlagBits::eGraphics) {
        m_physicalDevice = pd;
        m_queueFamily = i;
        core::Logger::RHI.info("Vulkan tests run on {}", props.deviceName.data());
        return true;
      }
    }
  }

  core::Logger::RHI.warn("No Vulkan 1.3 device with a graphics queue");
  return false;
}

void VulkanTestContext::createLogicalDevice() {
  const float priority = 1.0F;
  vk::DeviceQueueCreateInfo queueInfo{};
  queueInfo.queueFamilyIndex = m_queueFamily;
  queueInfo.queueCount = 1;
  queueInfo.pQueuePriorities = &priority;

  // Texture uploads record pipelineBarrier2
  vk::PhysicalDeviceVulkan13Features features13{};
  features13.synchronization2 = VK_TRUE;

  vk::DeviceCreateInfo createInfo{};
  createInfo.pNext = &features13;
  createInfo.queueCreateInfoCount = 1;
  createInfo.pQueueCreateInfos = &queueInfo;

  m_device = m_physicalDevice.createDevice(createInfo);
  VULKAN_HPP_DEFAULT_DISPATCHER.init(m_device);
  m_queue = m_device.getQueue(m_queueFamily, 0);
}

bool VulkanTestContext::setup() {
  if (m_isSetup) {
    return true;
  }

  if (!createInstance()) {
    teardown();
    return false;
  }
  m_isSetup = true;

  if (!selectPhysicalDevice()) {
    teardown();
    return false;
  }

  createLogicalDevice();

  kiln::renderer::rhi::vulkan::VulkanDeviceContext context{};
  context.instance = m_instance;
  context.physicalDevice = m_physicalDevice;
  context.device = m_device;
  context.queue = m_queue;
  context.queueFamily = m_queueFamily;
  context.getInstanceProcAddr = m_getInstanceProcAddr;
  m_rhiDevice = kiln::renderer::rhi::RHIFactory::adoptVulkanDevice(context);

  core::Logger::RHI.info("Vulkan test context setup complete");
  return true;
}

void VulkanTestContext::teardown() {
  m_rhiDevice.reset();

  if (m_device) {
    m_device.destroy();
    m_device = vk::Device{};
  }
  if (m_instance) {
    m_instance.destroy();
    m_instance = vk::Instance{};
  }
  m_physicalDevice = vk::PhysicalDevice{};
  m_queue = vk::Queue{};
  m_loader.reset();

  m_isSetup = false;
}

kiln::renderer::rhi::RHIDevice *VulkanTestContext::device() const {
  return m_rhiDevice.get();
}

kiln::renderer::rhi::vulkan::VulkanRHIDevice *VulkanTestContext::vulkanDevice() const {
  return dynamic_cast<kiln::renderer::rhi::vulkan::VulkanRHIDevice *>(m_rhiDevice.get());
}

} // namespace kiln::tests
