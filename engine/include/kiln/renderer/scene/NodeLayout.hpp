#pragma once

#include "kiln/assets/LoadError.hpp"
#include "kiln/core/Handle.h"
#include <glm/mat4x4.hpp>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace fastgltf { class Asset; }

namespace kiln::renderer::scene
{
    struct NodeRecord
    {
        NodeIndex index;
        glm::mat4 localTransform{1.0F};
        std::optional<NodeIndex> parent;
        std::vector<NodeIndex> children;
        std::optional<MeshIndex> mesh;
        std::string name;
    };

    // Flattened node hierarchy of one document. Built once, immutable afterwards.
    class NodeLayout
    {
    public:
        static assets::LoadResult<NodeLayout> fromDocument(const fastgltf::Asset& gltf);

        // Product of local transforms from the root down to node
        glm::mat4 worldTransform(NodeIndex node) const;

        const NodeRecord& node(NodeIndex node) const;
        size_t nodeCount() const { return m_nodes.size(); }
        std::span<const NodeRecord> nodes() const { return m_nodes; }
        std::span<const NodeIndex> roots() const { return m_roots; }

        // Nodes instancing mesh, in document order; empty for unreferenced meshes
        std::span<const NodeIndex> meshNodes(MeshIndex mesh) const;
        std::optional<MeshIndex> nodeMesh(NodeIndex node) const;

    private:
        std::vector<NodeRecord> m_nodes;
        std::vector<NodeIndex> m_roots;
        std::vector<std::vector<NodeIndex>> m_meshNodes;
    };

    // Local matrix of a document node, from its matrix or its T*R*S
    glm::mat4 localMatrix(const fastgltf::Asset& gltf, size_t nodeIndex);
}
