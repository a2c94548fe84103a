#pragma once

#include "kiln/core/Handle.h"
#include "kiln/renderer/geometry/Vertex.h"
#include "kiln/renderer/scene/Bounds.hpp"
#include "kiln/renderer/scene/Material.hpp"
#include <glm/mat4x4.hpp>
#include <optional>
#include <string>
#include <vector>

namespace kiln::renderer::scene
{
    // Indices into the owning pack's channel arena targeting one instance's node
    using ChannelList = std::vector<uint32_t>;

    struct Primitive
    {
        uint32_t id = 0;
        std::vector<PrimitiveVertex> vertices;
        std::optional<std::vector<uint32_t>> indices;
        Material material;
        Aabb aabb;

        // Parallel per-instance arrays, one entry per node instancing the mesh
        std::vector<glm::mat4> instanceTransforms;
        std::vector<ChannelList> instanceAnimations;
        std::vector<NodeIndex> instanceNodes;

        uint32_t instanceCount() const { return static_cast<uint32_t>(instanceTransforms.size()); }

        bool isAnimated() const
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
    };

    struct Mesh
    {
        MeshIndex index;
        std::string name;
        std::vector<Primitive> primitives;
        Aabb aabb;
    };
}
