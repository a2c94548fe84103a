#include "kiln/assets/ModelAssetPack.hpp"

#include "kiln/assets/MeshAssembler.hpp"
#include "kiln/assets/TextureLoader.hpp"
#include "kiln/core/FileIO.hpp"
#include "kiln/core/common.hpp"
#include "kiln/core/logger.hpp"
#include "kiln/renderer/scene/InstanceBatcher.hpp"
#include <chrono>
#include <fastgltf/core.hpp>
#include <fastgltf/types.hpp>

namespace kiln::assets
{
    using renderer::scene::AlphaMode;

    bool PackedPrimitive::isAnimated() const
    {
        for (const auto& channels : instanceAnimations)
        {
            if (!channels.empty())
            {
                return true;
            }
        }
        return false;
    }

    ModelAssetPack::~ModelAssetPack() = default;

    namespace
    {
        // Directory that external buffers and images resolve against. Bare
        // filenames resolve against the working directory.
        std::filesystem::path documentDirectory(const std::filesystem::path& path)
        {
            return path.parent_path().empty() ? std::filesystem::current_path() : path.parent_path();
        }

        LoadResult<fastgltf::Asset> parseDocument(const std::filesystem::path& path,
                                                  const std::filesystem::path& baseDir,
                                                  std::span<const std::byte> bytes)
        {
            fastgltf::Parser parser(fastgltf::Extensions::KHR_mesh_quantization |
                                    fastgltf::Extensions::KHR_texture_transform |
                                    fastgltf::Extensions::KHR_materials_emissive_strength);

            auto dataResult = fastgltf::GltfDataBuffer::FromBytes(bytes.data(), bytes.size());
            if (dataResult.error() != fastgltf::Error::None)
            {
                return loadError(LoadErrorKind::InvalidGltf, "'{}': {}", path.string(),
                                 fastgltf::getErrorMessage(dataResult.error()));
            }

            // External images are read by imageBytes so a missing file is an InvalidPath
            auto expected = parser.loadGltf(dataResult.get(), baseDir, fastgltf::Options::LoadExternalBuffers);
            if (expected.error() != fastgltf::Error::None)
            {
                return loadError(LoadErrorKind::InvalidGltf, "'{}': {}", path.string(),
                                 fastgltf::getErrorMessage(expected.error()));
            }
            return std::move(expected.get());
        }
    }

    LoadResult<ModelAssetPack> ModelAssetPack::fromPath(const renderer::RenderContext& context,
                                                        const std::filesystem::path& path)
    {
        auto bytes = core::readFileBytes(path);
        if (!bytes)
        {
            return loadError(LoadErrorKind::InvalidPath, "cannot read '{}'", path.string());
        }
        return fromBytes(context, path, *bytes);
    }

    LoadResult<ModelAssetPack> ModelAssetPack::fromBytes(const renderer::RenderContext& context,
                                                         const std::filesystem::path& path,
                                                         std::span<const std::byte> bytes)
    {
        const auto startTime = std::chrono::high_resolution_clock::now();
        core::Logger::Asset.info("Loading '{}' ({} bytes)", path.string(), bytes.size());

        const std::filesystem::path baseDir = documentDirectory(path);
        auto document = parseDocument(path, baseDir, bytes);
        if (!document)
        {
            return core::Unexpected<LoadError>(std::move(document.error()));
        }
        const fastgltf::Asset& gltf = *document;

        if (gltf.scenes.empty())
        {
            return loadError(LoadErrorKind::NoScene, "'{}' declares no scene", path.string());
        }

        ModelAssetPack pack;
        pack.m_path = path;
        pack.m_name = path.filename().string();

        auto layout = renderer::scene::NodeLayout::fromDocument(gltf);
        if (!layout)
        {
            return core::Unexpected<LoadError>(std::move(layout.error()));
        }
        pack.m_layout = std::move(*layout);

        auto channels = renderer::scene::parseAnimations(gltf);
        if (!channels)
        {
            return core::Unexpected<LoadError>(std::move(channels.error()));
        }
        pack.m_channels = std::move(*channels);

        // Geometry
        const renderer::scene::InstanceBatcher batcher(pack.m_layout, pack.m_channels);
        AssemblyContext assembly;
        pack.m_meshCount = gltf.meshes.size();
        for (size_t meshIdx = 0; meshIdx < gltf.meshes.size(); ++meshIdx)
        {
            auto mesh = MeshAssembler::parse(batcher, gltf, MeshIndex{util::u32(meshIdx)}, assembly);
            if (!mesh)
            {
                return core::Unexpected<LoadError>(std::move(mesh.error()));
            }

            for (auto& prim : mesh->primitives)
            {
                const size_t vertexEnd = pack.m_vertices.size() + prim.vertices.size();
                const size_t indexEnd = pack.m_indices.size() + (prim.indices ? prim.indices->size() : 0);
                if (!util::checkedU32(vertexEnd) || !util::checkedU32(indexEnd))
                {
                    return loadError(LoadErrorKind::HandleOverflow, "'{}' packs more than 2^32 vertices or indices",
                                     path.string());
                }

                PackedPrimitive packed;
                packed.id = prim.id;
                packed.mesh = mesh->index;
                packed.vertexRange = {util::u32(pack.m_vertices.size()), util::u32(vertexEnd)};
                pack.m_vertices.insert(pack.m_vertices.end(), prim.vertices.begin(), prim.vertices.end());

                if (prim.indices)
                {
                    packed.indexRange = ElementRange{util::u32(pack.m_indices.size()), util::u32(indexEnd)};
                    pack.m_indices.insert(pack.m_indices.end(), prim.indices->begin(), prim.indices->end());
                }

                packed.material = std::move(prim.material);
                packed.aabb = prim.aabb;
                packed.instanceTransforms = std::move(prim.instanceTransforms);
                packed.instanceAnimations = std::move(prim.instanceAnimations);
                packed.instanceNodes = std::move(prim.instanceNodes);
                pack.m_primitives.push_back(std::move(packed));
            }
            pack.m_aabb.unite(mesh->aabb);
        }

        // Textures, one per source image
        pack.m_textures.reserve(gltf.images.size());
        pack.m_colorBindGroups.reserve(gltf.images.size());
        for (size_t imageIdx = 0; imageIdx < gltf.images.size(); ++imageIdx)
        {
            const auto& image = gltf.images[imageIdx];
            const std::string debugName = image.name.empty()
                                              ? std::format("{}#image{}", pack.m_name, imageIdx)
                                              : std::string(image.name);

            auto encoded = imageBytes(gltf, image, baseDir);
            if (!encoded)
            {
                return core::Unexpected<LoadError>(std::move(encoded.error()));
            }
            auto decoded = decodeImage(*encoded, debugName);
            if (!decoded)
            {
                return core::Unexpected<LoadError>(std::move(decoded.error()));
            }

            auto texture = uploadTexture(context.device(), *decoded, debugName);
            pack.m_colorBindGroups.push_back(context.createColorBindGroup(*texture));
            pack.m_textures.push_back(std::move(texture));
        }

        for (const auto& prim : pack.m_primitives)
        {
            const auto& color = prim.material.baseColorTexture;
            if (color && color->textureIndex >= pack.m_textures.size())
            {
                return loadError(LoadErrorKind::MalformedDocument, "primitive {} samples image {} (only {})", prim.id,
                                 color->textureIndex, pack.m_textures.size());
            }
        }

        const auto endTime = std::chrono::high_resolution_clock::now();
        const double duration = std::chrono::duration<double, std::milli>(endTime - startTime).count();
        core::Logger::Asset.info(
            "Loaded '{}' in {:.2f}ms: {} meshes, {} primitives, {} vertices, {} indices, {} textures, {} channels{}",
            pack.m_name, duration, pack.m_meshCount, pack.m_primitives.size(), pack.m_vertices.size(),
            pack.m_indices.size(), pack.m_textures.size(), pack.m_channels.size(),
            pack.isTransparent() ? " (transparent)" : "");
        return pack;
    }

    std::span<const renderer::PrimitiveVertex> ModelAssetPack::primitiveVertices(const PackedPrimitive& primitive) const
    {
        return std::span<const renderer::PrimitiveVertex>(m_vertices)
            .subspan(primitive.vertexRange.start, primitive.vertexRange.count());
    }

    std::span<const uint32_t> ModelAssetPack::primitiveIndices(const PackedPrimitive& primitive) const
    {
        if (!primitive.indexRange)
        {
            return {};
        }
        return std::span<const uint32_t>(m_indices).subspan(primitive.indexRange->start, primitive.indexRange->count());
    }

    renderer::rhi::RHITexture* ModelAssetPack::texture(uint32_t imageIndex) const
    {
        return imageIndex < m_textures.size() ? m_textures[imageIndex].get() : nullptr;
    }

    renderer::rhi::RHIDescriptorSet* ModelAssetPack::colorBindGroup(uint32_t imageIndex) const
    {
        return imageIndex < m_colorBindGroups.size() ? m_colorBindGroups[imageIndex].get() : nullptr;
    }

    bool ModelAssetPack::isTransparent() const
    {
        for (const auto& prim : m_primitives)
        {
            if (prim.material.alphaMode == AlphaMode::Blend)
            {
                return true;
            }
        }
        return false;
    }
}
