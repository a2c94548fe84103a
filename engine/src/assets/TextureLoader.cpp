#include "kiln/assets/TextureLoader.hpp"
#include "kiln/core/FileIO.hpp"
#include "kiln/core/common.hpp"
#include "kiln/core/logger.hpp"

#include <fastgltf/types.hpp>
#include <stb_image.h>

#include <cstring>

namespace kiln::assets {

    namespace {
        std::span<const std::byte> bufferViewBytes(const fastgltf::Asset& gltf, size_t bufferViewIndex) {
            if (bufferViewIndex >= gltf.bufferViews.size()) {
                return {};
            }
            const auto& bv = gltf.bufferViews[bufferViewIndex];
            if (bv.bufferIndex >= gltf.buffers.size()) {
                return {};
            }
            std::span<const std::byte> whole;
            std::visit(fastgltf::visitor{
                [&](const fastgltf::sources::Array& a) { whole = {a.bytes.data(), a.bytes.size()}; },
                [&](const fastgltf::sources::Vector& v) { whole = {v.bytes.data(), v.bytes.size()}; },
                [&](const fastgltf::sources::ByteView& v) { whole = {v.bytes.data(), v.bytes.size()}; },
                [](const auto&) {}
            }, gltf.buffers[bv.bufferIndex].data);

            if (bv.byteOffset + bv.byteLength > whole.size()) {
                return {};
            }
            return whole.subspan(bv.byteOffset, bv.byteLength);
        }
    }

    std::vector<std::byte> expandToRgba(std::span<const std::byte> rgb, uint32_t width, uint32_t height) {
        const size_t texels = static_cast<size_t>(width) * height;
        if (rgb.size() < texels * 3) {
            throw cpptrace::logic_error("expandToRgba: " + std::to_string(rgb.size()) + " bytes for " +
                                        std::to_string(texels) + " RGB texels");
        }
        std::vector<std::byte> rgba(texels * 4);
        for (size_t i = 0; i < texels; ++i) {
            rgba[(i * 4) + 0] = rgb[(i * 3) + 0];
            rgba[(i * 4) + 1] = rgb[(i * 3) + 1];
            rgba[(i * 4) + 2] = rgb[(i * 3) + 2];
            rgba[(i * 4) + 3] = std::byte{0xFF};
        }
        return rgba;
    }

    LoadResult<DecodedImage> decodeImage(std::span<const std::byte> encoded, const std::string& debugName) {
        const auto* data = reinterpret_cast<const stbi_uc*>(encoded.data());
        const int len = static_cast<int>(encoded.size());

        if (stbi_is_16_bit_from_memory(data, len) != 0) {
            return loadError(LoadErrorKind::UnsupportedPixelFormat, "image '{}' has 16-bit channels", debugName);
        }

        int w = 0;
        int h = 0;
        int c = 0;
        stbi_uc* pixels = stbi_load_from_memory(data, len, &w, &h, &c, 0);
        if (pixels == nullptr) {
            return loadError(LoadErrorKind::UnsupportedPixelFormat, "image '{}' could not be decoded: {}", debugName,
                             stbi_failure_reason());
        }
        auto freePixels = util::makeScopeGuard([&] { stbi_image_free(pixels); });

        DecodedImage out;
        out.width = static_cast<uint32_t>(w);
        out.height = static_cast<uint32_t>(h);
        const size_t texels = static_cast<size_t>(out.width) * out.height;
        const std::span<const std::byte> raw(reinterpret_cast<const std::byte*>(pixels), texels * static_cast<size_t>(c));

        switch (c) {
        case 3:
            out.pixels = expandToRgba(raw, out.width, out.height);
            break;
        case 4:
            out.pixels.assign(raw.begin(), raw.end());
            break;
        default:
            return loadError(LoadErrorKind::UnsupportedPixelFormat, "image '{}' has {} channels ({}x{})", debugName, c,
                             w, h);
        }

        core::Logger::Asset.trace("Decoded image '{}' {}x{} ({} channels)", debugName, w, h, c);
        return out;
    }

    LoadResult<std::vector<std::byte>> imageBytes(const fastgltf::Asset& gltf,
                                                  const fastgltf::Image& image,
                                                  const std::filesystem::path& baseDir) {
        std::optional<LoadError> failure;
        std::vector<std::byte> bytes;
        std::visit(fastgltf::visitor{
            [&](const fastgltf::sources::BufferView& view) {
                const auto span = bufferViewBytes(gltf, view.bufferViewIndex);
                if (span.empty()) {
                    failure = LoadError{LoadErrorKind::MalformedDocument,
                                        std::format("image '{}' buffer view {} is unavailable", image.name,
                                                    view.bufferViewIndex)};
                    return;
                }
                bytes.assign(span.begin(), span.end());
            },
            [&](const fastgltf::sources::Array& a) { bytes.assign(a.bytes.begin(), a.bytes.end()); },
            [&](const fastgltf::sources::Vector& v) { bytes.assign(v.bytes.begin(), v.bytes.end()); },
            [&](const fastgltf::sources::ByteView& v) { bytes.assign(v.bytes.begin(), v.bytes.end()); },
            [&](const fastgltf::sources::URI& uriSrc) {
                if (!uriSrc.uri.isLocalPath()) {
                    failure = LoadError{LoadErrorKind::InvalidPath,
                                        std::format("image '{}' uri is not a local path", image.name)};
                    return;
                }
                const auto path = baseDir / uriSrc.uri.fspath();
                auto file = core::readFileBytes(path);
                if (!file) {
                    failure = LoadError{LoadErrorKind::InvalidPath,
                                        std::format("image file '{}' is unreadable", path.string())};
                    return;
                }
                bytes = std::move(*file);
            },
            [&](const auto&) {
                failure = LoadError{LoadErrorKind::MalformedDocument,
                                    std::format("image '{}' has no data source", image.name)};
            }
        }, image.data);

        if (failure) {
            return core::Unexpected<LoadError>(std::move(*failure));
        }
        return bytes;
    }

    std::unique_ptr<renderer::rhi::RHITexture> uploadTexture(renderer::rhi::RHIDevice& device,
                                                             const DecodedImage& image,
                                                             const std::string& debugName) {
        using namespace renderer::rhi;

        TextureDescriptor desc{};
        desc.type = TextureType::Texture2D;
        desc.extent = {image.width, image.height, 1};
        desc.format = Format::R8G8B8A8_SRGB;
        desc.usage = TextureUsage::Sampled | TextureUsage::TransferDst;
        desc.mipLevels = 1;
        desc.arrayLayers = 1;
        desc.debugName = debugName.c_str();

        auto texture = device.createTexture(desc);
        texture->uploadData(image.pixels);
        return texture;
    }

}
