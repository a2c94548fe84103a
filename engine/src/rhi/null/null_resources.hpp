#pragma once

#include "kiln/core/logger.hpp"
#include "kiln/rhi/rhi_buffer.hpp"
#include "kiln/rhi/rhi_descriptor.hpp"
#include "kiln/rhi/rhi_sampler.hpp"
#include "kiln/rhi/rhi_texture.hpp"
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kiln::renderer::rhi {

class NullRHIBuffer : public RHIBuffer {
public:
  explicit NullRHIBuffer(const BufferDescriptor &desc)
      : m_size(desc.size), m_usage(desc.usage),
        m_memoryUsage(desc.memoryUsage),
        m_debugName(desc.debugName != nullptr ? desc.debugName : "") {
    m_storage.resize(m_size);
    if (!desc.data.empty()) {
      uploadData(desc.data, 0);
    }

    kiln::core::Logger::RHI.trace("NullRHIBuffer created: {} (size: {})",
                                  m_debugName, m_size);
  }

  std::byte *map() override {
    if (m_storage.empty())
      return nullptr;
    return m_storage.data();
  }
  void unmap() override {}
  void uploadData(std::span<const std::byte> data, uint64_t offset) override {
    if (offset + data.size() > m_storage.size()) {
      kiln::core::Logger::RHI.error(
          "NullRHIBuffer::uploadData out of bounds: {} (offset: {}, size: {}, "
          "capacity: {})",
          m_debugName, offset, data.size(), m_storage.size());
      return;
    }
    if (!data.empty()) {
      std::memcpy(m_storage.data() + offset, data.data(), data.size());
    }
  }

  uint64_t size() const override { return m_size; }
  BufferUsage usage() const override { return m_usage; }
  MemoryUsage memoryUsage() const override { return m_memoryUsage; }

  void *nativeHandle() const override { return (void *)m_storage.data(); }

  std::span<const std::byte> contents() const { return m_storage; }

private:
  uint64_t m_size;
  BufferUsage m_usage;
  MemoryUsage m_memoryUsage;
  std::string m_debugName;
  std::vector<std::byte> m_storage;
};

class NullRHITexture : public RHITexture {
public:
  explicit NullRHITexture(const TextureDescriptor &desc)
      : m_extent(desc.extent), m_format(desc.format),
        m_mipLevels(desc.mipLevels), m_arrayLayers(desc.arrayLayers),
        m_usage(desc.usage),
        m_debugName(desc.debugName != nullptr ? desc.debugName : "") {
    kiln::core::Logger::RHI.trace("NullRHITexture created: {} ({}x{})",
                                  m_debugName, m_extent.width,
                                  m_extent.height);
  }

  void uploadData(std::span<const std::byte> data,
                  const TextureSubresource &subresource) override {
    if (subresource.mipLevel != 0 || subresource.arrayLayer != 0) {
      kiln::core::Logger::RHI.trace(
          "NullRHITexture::uploadData ignores subresource {}/{}: {}",
          subresource.mipLevel, subresource.arrayLayer, m_debugName);
      return;
    }
    m_texels.assign(data.begin(), data.end());
  }

  const Extent3D &extent() const override { return m_extent; }
  Format format() const override { return m_format; }
  uint32_t mipLevels() const override { return m_mipLevels; }
  uint32_t arrayLayers() const override { return m_arrayLayers; }
  TextureUsage usage() const override { return m_usage; }

  void *nativeHandle() const override { return (void *)this; }
  void *nativeView() const override { return (void *)this; }

  // Base level as last uploaded
  std::span<const std::byte> texels() const { return m_texels; }

private:
  Extent3D m_extent;
  Format m_format;
  uint32_t m_mipLevels;
  uint32_t m_arrayLayers;
  TextureUsage m_usage;
  std::string m_debugName;
  std::vector<std::byte> m_texels;
};

class NullRHISampler : public RHISampler {
public:
  explicit NullRHISampler(const SamplerDescriptor &desc) : m_desc(desc) {}

  const SamplerDescriptor &description() const override { return m_desc; }
  void *nativeHandle() const override { return (void *)this; }

private:
  SamplerDescriptor m_desc;
};

class NullRHIDescriptorSetLayout : public RHIDescriptorSetLayout {
public:
  explicit NullRHIDescriptorSetLayout(DescriptorSetLayout desc)
      : m_desc(std::move(desc)) {}

  void *nativeHandle() const override { return (void *)this; }
  const DescriptorSetLayout &description() const override { return m_desc; }

private:
  DescriptorSetLayout m_desc;
};

// Records what each binding currently points at
class NullRHIDescriptorSet : public RHIDescriptorSet {
public:
  struct Binding {
    RHIBuffer *buffer = nullptr;
    RHITexture *texture = nullptr;
    RHISampler *sampler = nullptr;
  };

  explicit NullRHIDescriptorSet(NullRHIDescriptorSetLayout *layout)
      : m_layout(layout) {}

  void updateBuffer(uint32_t binding, RHIBuffer *buffer, uint64_t /*offset*/,
                    uint64_t /*range*/) override {
    const auto *slot = m_layout->description().find(binding);
    if (slot == nullptr || isImageDescriptor(slot->type)) {
      kiln::core::Logger::RHI.error(
          "updateBuffer: binding {} is not a buffer descriptor", binding);
      return;
    }
    m_bindings[binding].buffer = buffer;
  }

  void updateTexture(uint32_t binding, RHITexture *texture,
                     RHISampler *sampler) override {
    const auto *slot = m_layout->description().find(binding);
    if (slot == nullptr || !isImageDescriptor(slot->type)) {
      kiln::core::Logger::RHI.error(
          "updateTexture: binding {} is not an image descriptor", binding);
      return;
    }
    auto &entry = m_bindings[binding];
    entry.texture = texture;
    entry.sampler = sampler;
  }

  RHIDescriptorSetLayout *layout() const override { return m_layout; }
  void *nativeHandle() const override { return (void *)this; }

  const Binding *binding(uint32_t index) const {
    auto it = m_bindings.find(index);
    return it != m_bindings.end() ? &it->second : nullptr;
  }

private:
  NullRHIDescriptorSetLayout *m_layout;
  std::unordered_map<uint32_t, Binding> m_bindings;
};

} // namespace kiln::renderer::rhi
