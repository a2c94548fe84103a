#include "kiln/renderer/scene/Material.hpp"

#include "kiln/core/Settings.hpp"
#include "kiln/core/common.hpp"
#include "kiln/core/logger.hpp"
#include <fastgltf/types.hpp>
#include <glm/gtc/type_ptr.hpp>

namespace kiln::renderer::scene
{
    using assets::LoadErrorKind;
    using assets::loadError;

    const char* toString(AlphaMode mode)
    {
        switch (mode)
        {
        case AlphaMode::Opaque: return "OPAQUE";
        case AlphaMode::Mask: return "MASK";
        case AlphaMode::Blend: return "BLEND";
        }
        return "unknown";
    }

    namespace
    {
        AlphaMode toAlphaMode(fastgltf::AlphaMode mode)
        {
            switch (mode)
            {
            case fastgltf::AlphaMode::Mask:
                return AlphaMode::Mask;
            case fastgltf::AlphaMode::Blend:
                return AlphaMode::Blend;
            case fastgltf::AlphaMode::Opaque:
            default:
                return AlphaMode::Opaque;
            }
        }

        // Works for TextureInfo, NormalTextureInfo and OcclusionTextureInfo
        template <typename Info>
        assets::LoadResult<std::optional<TextureRef>> resolveTexture(const fastgltf::Asset& gltf,
                                                                     const std::optional<Info>& info)
        {
            if (!info)
            {
                return std::optional<TextureRef>{};
            }
            if (info->textureIndex >= gltf.textures.size())
            {
                return loadError(LoadErrorKind::MalformedDocument, "material references texture {} (only {})",
                                 info->textureIndex, gltf.textures.size());
            }
            const auto& texture = gltf.textures[info->textureIndex];
            if (!texture.imageIndex.has_value() || texture.imageIndex.value() >= gltf.images.size())
            {
                return loadError(LoadErrorKind::MalformedDocument, "texture {} has no usable image source",
                                 info->textureIndex);
            }
            auto image = util::checkedU32(texture.imageIndex.value());
            auto uvSet = util::checkedU32(info->texCoordIndex);
            if (!image || !uvSet)
            {
                return loadError(LoadErrorKind::HandleOverflow, "texture {} image or uv set index",
                                 info->textureIndex);
            }
            return std::optional<TextureRef>{TextureRef{*image, *uvSet}};
        }
    }

    assets::LoadResult<Material> Material::fromGltf(const fastgltf::Asset& gltf,
                                                    std::optional<size_t> materialIndex)
    {
        Material out{};
        if (!materialIndex.has_value())
        {
            return out;
        }
        if (materialIndex.value() >= gltf.materials.size())
        {
            return loadError(LoadErrorKind::MalformedDocument, "primitive references material {} (only {})",
                             materialIndex.value(), gltf.materials.size());
        }

        const auto& mat = gltf.materials[materialIndex.value()];
        const auto& pbr = mat.pbrData;
        out.name = std::string(mat.name);
        out.baseColorFactor = glm::make_vec4(pbr.baseColorFactor.data());
        out.emissiveFactor = glm::make_vec3(mat.emissiveFactor.data());
        out.metallicFactor = pbr.metallicFactor;
        out.roughnessFactor = pbr.roughnessFactor;
        out.occlusionStrength = mat.occlusionTexture ? mat.occlusionTexture->strength : 1.0F;
        out.alphaMode = toAlphaMode(mat.alphaMode);
        out.alphaCutoff = mat.alphaCutoff;
        out.doubleSided = mat.doubleSided;

        auto color = resolveTexture(gltf, pbr.baseColorTexture);
        auto emissive = resolveTexture(gltf, mat.emissiveTexture);
        auto normal = resolveTexture(gltf, mat.normalTexture);
        auto occlusion = resolveTexture(gltf, mat.occlusionTexture);
        auto metallicRoughness = resolveTexture(gltf, pbr.metallicRoughnessTexture);
        for (auto* result : {&color, &emissive, &normal, &occlusion, &metallicRoughness})
        {
            if (!*result)
            {
                return core::Unexpected<assets::LoadError>(result->error());
            }
        }
        out.baseColorTexture = *color;
        out.emissiveTexture = *emissive;
        out.normalTexture = *normal;
        out.occlusionTexture = *occlusion;
        out.metallicRoughnessTexture = *metallicRoughness;

        if (core::settings::verboseAssets.get())
        {
            core::Logger::Asset.debug("  material {} '{}': {}, cutoff {}, color texture {}",
                                      materialIndex.value(), out.name, toString(out.alphaMode), out.alphaCutoff,
                                      out.baseColorTexture ? static_cast<int64_t>(out.baseColorTexture->textureIndex)
                                                           : -1);
        }
        return out;
    }
}
