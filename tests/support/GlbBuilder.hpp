#pragma once

#include <fastgltf/core.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kiln::tests {

// Assembles a binary glTF document in memory: accessors and images are packed
// into the BIN chunk, every other top-level section is supplied as raw JSON.
class GlbBuilder {
public:
  uint32_t addBufferView(std::span<const std::byte> bytes);

  // FLOAT accessor; type is "SCALAR", "VEC2", "VEC3" or "VEC4"
  uint32_t addFloatAccessor(std::span<const float> values, std::string_view type,
                            bool withBounds = false);

  uint32_t addIndexAccessor(std::span<const uint8_t> indices);
  uint32_t addIndexAccessor(std::span<const uint16_t> indices);
  uint32_t addIndexAccessor(std::span<const uint32_t> indices);

  // Image stored in a buffer view; returns the image index
  uint32_t addImage(std::span<const std::byte> encoded,
                    std::string_view mimeType = "image/png");

  // Raw JSON array for "nodes", "meshes", "materials", "textures",
  // "animations" or "scenes". Without an explicit "scenes" the document gets a
  // single default scene holding node 0.
  GlbBuilder &set(std::string_view section, std::string json);

  std::vector<std::byte> build() const;

  // Parses build() the way the loader does; throws std::runtime_error on failure
  fastgltf::Asset parse() const;

  // Writes build() to path and returns path
  std::filesystem::path writeTo(const std::filesystem::path &path) const;

private:
  uint32_t addAccessor(std::span<const std::byte> bytes, uint32_t componentType,
                       std::string_view type, size_t count,
                       const std::string &bounds);

  std::vector<std::byte> m_bin;
  std::vector<std::string> m_bufferViews;
  std::vector<std::string> m_accessors;
  std::vector<std::string> m_images;
  std::map<std::string, std::string, std::less<>> m_sections;
};

// Uncompressed (stored deflate) PNG. channels: 1 grey, 3 RGB, 4 RGBA.
// bitDepth 16 doubles the bytes per sample; pixels are big-endian then.
std::vector<std::byte> encodePng(uint32_t width, uint32_t height, uint32_t channels,
                                 std::span<const uint8_t> pixels, uint32_t bitDepth = 8);

// Fresh, empty directory under the system temp directory
std::filesystem::path scratchDirectory(std::string_view name);

} // namespace kiln::tests
