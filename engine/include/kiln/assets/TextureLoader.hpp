#pragma once

#include "kiln/assets/LoadError.hpp"
#include "kiln/rhi/rhi_device.hpp"
#include "kiln/rhi/rhi_texture.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace fastgltf { class Asset; struct Image; }

namespace kiln::assets {

    // Base level of one image, always 8-bit RGBA
    struct DecodedImage {
        uint32_t width = 0;
        uint32_t height = 0;
        std::vector<std::byte> pixels;
    };

    // Appends an opaque alpha channel to tightly packed RGB8 texels
    std::vector<std::byte> expandToRgba(std::span<const std::byte> rgb, uint32_t width, uint32_t height);

    // Decodes PNG, JPEG, TGA, BMP, PNM... through stb_image. Only 8-bit RGB and
    // RGBA are accepted; everything else is UnsupportedPixelFormat.
    LoadResult<DecodedImage> decodeImage(std::span<const std::byte> encoded, const std::string& debugName);

    // Encoded bytes of a document image, from a buffer view, embedded data or a
    // file next to the document
    LoadResult<std::vector<std::byte>> imageBytes(const fastgltf::Asset& gltf,
                                                  const fastgltf::Image& image,
                                                  const std::filesystem::path& baseDir);

    // R8G8B8A8_SRGB, sampled, transfer destination
    std::unique_ptr<renderer::rhi::RHITexture> uploadTexture(renderer::rhi::RHIDevice& device,
                                                             const DecodedImage& image,
                                                             const std::string& debugName);

}
