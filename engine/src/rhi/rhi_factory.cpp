#include "kiln/rhi/rhi_factory.hpp"

#include "kiln/core/logger.hpp"
#include "kiln/rhi/vulkan/vulkan_device.hpp"
#include "null/null_device.hpp"
#include <cpptrace/cpptrace.hpp>

namespace kiln::renderer::rhi
{
    std::unique_ptr<RHIDevice> RHIFactory::createDevice(RHIBackend backend)
    {
        switch (backend)
        {
        case RHIBackend::Null:
            core::Logger::RHI.info("Creating Null RHI device");
            return std::make_unique<NullRHIDevice>();
        case RHIBackend::Vulkan:
            core::Logger::RHI.error("The Vulkan backend adopts an existing device; use adoptVulkanDevice");
            throw cpptrace::logic_error("Vulkan devices must be adopted from external handles");
        }
        throw cpptrace::logic_error("Unknown RHI backend");
    }

    std::unique_ptr<RHIDevice> RHIFactory::adoptVulkanDevice(const vulkan::VulkanDeviceContext& context)
    {
        return std::make_unique<vulkan::VulkanRHIDevice>(context);
    }
}
