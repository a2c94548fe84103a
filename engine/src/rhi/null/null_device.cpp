#include "null_device.hpp"

#include <cpptrace/cpptrace.hpp>

namespace kiln::renderer::rhi {

NullRHIDevice::NullRHIDevice() {
  kiln::core::Logger::RHI.trace("NullRHIDevice created");
}

NullRHIDevice::~NullRHIDevice() {
  kiln::core::Logger::RHI.trace(
      "NullRHIDevice destroyed ({} buffers, {} textures created)",
      m_buffersCreated, m_texturesCreated);
}

std::unique_ptr<RHIBuffer>
NullRHIDevice::createBuffer(const BufferDescriptor &desc) {
  if (!desc.data.empty() && desc.data.size() > desc.size) {
    throw cpptrace::logic_error("Initial buffer data exceeds buffer size");
  }
  kiln::core::Logger::RHI.trace(
      "NullRHIDevice::createBuffer: {}",
      desc.debugName != nullptr ? desc.debugName : "<unnamed>");
  ++m_buffersCreated;
  return std::make_unique<NullRHIBuffer>(desc);
}

std::unique_ptr<RHITexture>
NullRHIDevice::createTexture(const TextureDescriptor &desc) {
  kiln::core::Logger::RHI.trace(
      "NullRHIDevice::createTexture: {}",
      desc.debugName != nullptr ? desc.debugName : "<unnamed>");
  ++m_texturesCreated;
  return std::make_unique<NullRHITexture>(desc);
}

std::unique_ptr<RHISampler>
NullRHIDevice::createSampler(const SamplerDescriptor &desc) {
  kiln::core::Logger::RHI.trace("NullRHIDevice::createSampler");
  return std::make_unique<NullRHISampler>(desc);
}

std::unique_ptr<RHIDescriptorSetLayout>
NullRHIDevice::createDescriptorSetLayout(const DescriptorSetLayout &desc) {
  kiln::core::Logger::RHI.trace(
      "NullRHIDevice::createDescriptorSetLayout ({} bindings)",
      desc.bindings.size());
  return std::make_unique<NullRHIDescriptorSetLayout>(desc);
}

std::unique_ptr<RHIDescriptorSet>
NullRHIDevice::allocateDescriptorSet(RHIDescriptorSetLayout *layout) {
  auto *nullLayout = dynamic_cast<NullRHIDescriptorSetLayout *>(layout);
  if (nullLayout == nullptr) {
    throw cpptrace::logic_error(
        "allocateDescriptorSet: layout does not belong to the null backend");
  }
  return std::make_unique<NullRHIDescriptorSet>(nullLayout);
}

} // namespace kiln::renderer::rhi
