#pragma once

#include "null_resources.hpp"
#include "kiln/rhi/rhi_device.hpp"

namespace kiln::renderer::rhi {

class NullRHIDevice : public RHIDevice {
public:
  NullRHIDevice();
  ~NullRHIDevice() override;

  std::unique_ptr<RHIBuffer> createBuffer(const BufferDescriptor &desc) override;
  std::unique_ptr<RHITexture>
  createTexture(const TextureDescriptor &desc) override;
  std::unique_ptr<RHISampler>
  createSampler(const SamplerDescriptor &desc) override;

  std::unique_ptr<RHIDescriptorSetLayout>
  createDescriptorSetLayout(const DescriptorSetLayout &desc) override;
  std::unique_ptr<RHIDescriptorSet>
  allocateDescriptorSet(RHIDescriptorSetLayout *layout) override;

  void waitIdle() override {}

  RHIBackend backend() const override { return RHIBackend::Null; }
  const std::string &name() const override { return m_name; }

  // Creation counters (textures uploaded per load, buffers staged per frame)
  uint64_t buffersCreated() const { return m_buffersCreated; }
  uint64_t texturesCreated() const { return m_texturesCreated; }

private:
  std::string m_name = "Null RHI Device";
  uint64_t m_buffersCreated = 0;
  uint64_t m_texturesCreated = 0;
};
} // namespace kiln::renderer::rhi
