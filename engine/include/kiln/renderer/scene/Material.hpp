#pragma once

#include "kiln/assets/LoadError.hpp"
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace fastgltf { class Asset; }

namespace kiln::renderer::scene
{
    enum class AlphaMode : uint32_t
    {
        Opaque = 0,
        Mask = 1,
        Blend = 2
    };

    enum class BlendMode : uint8_t
    {
        Replace,
        PremultipliedAlpha
    };

    const char* toString(AlphaMode mode);

    constexpr BlendMode blendModeFor(AlphaMode mode)
    {
        return mode == AlphaMode::Blend ? BlendMode::PremultipliedAlpha : BlendMode::Replace;
    }

    struct TextureRef
    {
        uint32_t textureIndex = 0; // index of the source image, not of the glTF texture
        uint32_t uvSet = 0;
    };

    struct Material
    {
        std::string name;
        glm::vec4 baseColorFactor{1.0F};
        glm::vec3 emissiveFactor{0.0F};
        float occlusionStrength = 1.0F;
        float metallicFactor = 1.0F;
        float roughnessFactor = 1.0F;

        std::optional<TextureRef> baseColorTexture;
        std::optional<TextureRef> emissiveTexture;
        std::optional<TextureRef> normalTexture;
        std::optional<TextureRef> occlusionTexture;
        std::optional<TextureRef> metallicRoughnessTexture;

        AlphaMode alphaMode = AlphaMode::Opaque;
        float alphaCutoff = 0.5F;
        bool doubleSided = false;

        bool isTransparent() const { return alphaMode == AlphaMode::Blend; }
        BlendMode blendMode() const { return blendModeFor(alphaMode); }
        bool hasDefaultBaseColor() const { return baseColorFactor == glm::vec4(1.0F); }

        // Converts document material materialIndex, or the glTF default material
        // when the primitive names none
        static assets::LoadResult<Material> fromGltf(const fastgltf::Asset& gltf,
                                                     std::optional<size_t> materialIndex);
    };
}
