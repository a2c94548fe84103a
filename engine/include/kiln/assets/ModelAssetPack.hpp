#pragma once

#include "kiln/assets/LoadError.hpp"
#include "kiln/core/Handle.h"
#include "kiln/renderer/RenderContext.hpp"
#include "kiln/renderer/geometry/Vertex.h"
#include "kiln/renderer/scene/Animation.hpp"
#include "kiln/renderer/scene/Bounds.hpp"
#include "kiln/renderer/scene/Material.hpp"
#include "kiln/renderer/scene/Mesh.hpp"
#include "kiln/renderer/scene/NodeLayout.hpp"
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kiln::assets
{
    // Half-open [start, end) range of elements in a packed list
    struct ElementRange
    {
        uint32_t start = 0;
        uint32_t end = 0;

        uint32_t count() const { return end - start; }
    };

    struct PackedPrimitive
    {
        uint32_t id = 0;
        MeshIndex mesh;
        ElementRange vertexRange;
        std::optional<ElementRange> indexRange;
        renderer::scene::Material material;
        renderer::scene::Aabb aabb;

        std::vector<glm::mat4> instanceTransforms;
        std::vector<renderer::scene::ChannelList> instanceAnimations;
        std::vector<NodeIndex> instanceNodes;

        uint32_t instanceCount() const { return static_cast<uint32_t>(instanceTransforms.size()); }
        bool isAnimated() const;
    };

    // Everything one glTF asset contributes to the frame: packed geometry,
    // uploaded textures and the animation channels driving its instances.
    // Read-only once loaded.
    class ModelAssetPack
    {
    public:
        static LoadResult<ModelAssetPack> fromBytes(const renderer::RenderContext& context,
                                                    const std::filesystem::path& path,
                                                    std::span<const std::byte> bytes);

        static LoadResult<ModelAssetPack> fromPath(const renderer::RenderContext& context,
                                                   const std::filesystem::path& path);

        ModelAssetPack(ModelAssetPack&&) noexcept = default;
        ModelAssetPack& operator=(ModelAssetPack&&) noexcept = default;
        ~ModelAssetPack();

        const std::string& name() const { return m_name; }
        const std::filesystem::path& path() const { return m_path; }

        std::span<const renderer::PrimitiveVertex> vertices() const { return m_vertices; }
        std::span<const uint32_t> indices() const { return m_indices; }
        std::span<const PackedPrimitive> primitives() const { return m_primitives; }
        size_t primitiveCount() const { return m_primitives.size(); }

        std::span<const renderer::PrimitiveVertex> primitiveVertices(const PackedPrimitive& primitive) const;
        std::span<const uint32_t> primitiveIndices(const PackedPrimitive& primitive) const;

        // Indexed by source image
        size_t textureCount() const { return m_textures.size(); }
        renderer::rhi::RHITexture* texture(uint32_t imageIndex) const;
        renderer::rhi::RHIDescriptorSet* colorBindGroup(uint32_t imageIndex) const;

        std::span<const renderer::scene::AnimationChannel> channels() const { return m_channels; }
        const renderer::scene::NodeLayout& nodeLayout() const { return m_layout; }
        size_t meshCount() const { return m_meshCount; }

        const renderer::scene::Aabb& aabb() const { return m_aabb; }
        bool isTransparent() const;

    private:
        ModelAssetPack() = default;

        std::string m_name;
        std::filesystem::path m_path;

        std::vector<renderer::PrimitiveVertex> m_vertices;
        std::vector<uint32_t> m_indices;
        std::vector<PackedPrimitive> m_primitives;

        std::vector<std::unique_ptr<renderer::rhi::RHITexture>> m_textures;
        std::vector<std::unique_ptr<renderer::rhi::RHIDescriptorSet>> m_colorBindGroups;

        std::vector<renderer::scene::AnimationChannel> m_channels;
        renderer::scene::NodeLayout m_layout;
        size_t m_meshCount = 0;
        renderer::scene::Aabb m_aabb;
    };
}
