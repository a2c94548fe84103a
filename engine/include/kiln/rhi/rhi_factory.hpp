#pragma once

#include "rhi_types.hpp"
#include "rhi_device.hpp"
#include <memory>

namespace kiln::renderer::rhi
{
    namespace vulkan { struct VulkanDeviceContext; }

    class RHIFactory
    {
    public:
        // Devices that need no external handles (Null)
        static std::unique_ptr<RHIDevice> createDevice(RHIBackend backend);

        // Wraps handles owned by the presentation layer
        static std::unique_ptr<RHIDevice> adoptVulkanDevice(const vulkan::VulkanDeviceContext& context);
    };

} // namespace kiln::renderer::rhi
