#include "kiln/renderer/scene/NodeLayout.hpp"

#include "kiln/core/Settings.hpp"
#include "kiln/core/common.hpp"
#include "kiln/core/logger.hpp"
#include <cpptrace/cpptrace.hpp>
#include <fastgltf/types.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtc/type_ptr.hpp>

namespace kiln::renderer::scene
{
    using assets::LoadErrorKind;
    using assets::loadError;

    glm::mat4 localMatrix(const fastgltf::Asset& gltf, size_t nodeIndex)
    {
        const auto& node = gltf.nodes[nodeIndex];
        return std::visit(
            fastgltf::visitor{
                [&](const fastgltf::TRS& trs) {
                    const glm::vec3 t = glm::make_vec3(trs.translation.data());
                    const auto& q = trs.rotation;
                    const glm::quat r(q[3], q[0], q[1], q[2]);
                    const glm::vec3 s = glm::make_vec3(trs.scale.data());
                    return glm::translate(glm::mat4(1.0F), t) * glm::mat4_cast(r) *
                           glm::scale(glm::mat4(1.0F), s);
                },
                [&](const fastgltf::math::fmat4x4& m) {
                    return glm::make_mat4(m.data());
                } },
            node.transform);
    }

    assets::LoadResult<NodeLayout> NodeLayout::fromDocument(const fastgltf::Asset& gltf)
    {
        NodeLayout layout;
        const size_t nodeCount = gltf.nodes.size();

        if (!util::checkedU32(nodeCount) || !util::checkedU32(gltf.meshes.size()))
        {
            return loadError(LoadErrorKind::HandleOverflow,
                             "document has {} nodes and {} meshes, more than 32-bit handles address",
                             nodeCount, gltf.meshes.size());
        }

        layout.m_nodes.resize(nodeCount);
        layout.m_meshNodes.resize(gltf.meshes.size());

        for (size_t i = 0; i < nodeCount; ++i)
        {
            const auto& gNode = gltf.nodes[i];
            NodeRecord& record = layout.m_nodes[i];
            record.index = NodeIndex{util::u32(i)};
            record.localTransform = localMatrix(gltf, i);
            record.name = std::string(gNode.name);

            if (gNode.meshIndex.has_value())
            {
                const size_t meshIndex = gNode.meshIndex.value();
                if (meshIndex >= gltf.meshes.size())
                {
                    return loadError(LoadErrorKind::MalformedDocument,
                                     "node {} references mesh {} (only {} meshes)", i, meshIndex,
                                     gltf.meshes.size());
                }
                record.mesh = MeshIndex{util::u32(meshIndex)};
                layout.m_meshNodes[meshIndex].push_back(record.index);
            }

            record.children.reserve(gNode.children.size());
            for (size_t child : gNode.children)
            {
                if (child >= nodeCount)
                {
                    return loadError(LoadErrorKind::MalformedDocument,
                                     "node {} lists child {} (only {} nodes)", i, child, nodeCount);
                }
                record.children.push_back(NodeIndex{util::u32(child)});
            }
        }

        for (const auto& record : layout.m_nodes)
        {
            for (NodeIndex child : record.children)
            {
                NodeRecord& childRecord = layout.m_nodes[child.id];
                if (childRecord.parent.has_value())
                {
                    return loadError(LoadErrorKind::MalformedDocument,
                                     "node {} is a child of both node {} and node {}", child.id,
                                     childRecord.parent->id, record.index.id);
                }
                childRecord.parent = record.index;
            }
        }

        // Single parent per node: walking up the chain either reaches a root or
        // revisits a node, and the latter can only happen inside a cycle.
        enum class Visit : uint8_t { Unvisited, InProgress, Done };
        std::vector<Visit> state(nodeCount, Visit::Unvisited);
        std::vector<size_t> chain;
        for (size_t start = 0; start < nodeCount; ++start)
        {
            chain.clear();
            size_t current = start;
            while (state[current] == Visit::Unvisited)
            {
                state[current] = Visit::InProgress;
                chain.push_back(current);
                const auto& parent = layout.m_nodes[current].parent;
                if (!parent.has_value())
                {
                    break;
                }
                current = parent->id;
            }
            if (state[current] == Visit::InProgress && layout.m_nodes[current].parent.has_value())
            {
                return loadError(LoadErrorKind::MalformedDocument,
                                 "node hierarchy contains a cycle through node {}", current);
            }
            for (size_t visited : chain)
            {
                state[visited] = Visit::Done;
            }
        }

        for (const auto& record : layout.m_nodes)
        {
            if (!record.parent.has_value())
            {
                layout.m_roots.push_back(record.index);
            }
        }

        if (core::settings::verboseAssets.get())
        {
            for (const auto& record : layout.m_nodes)
            {
                core::Logger::Scene.debug("node {} '{}': parent {}, {} children, mesh {}",
                                          record.index.id, record.name,
                                          record.parent ? static_cast<int64_t>(record.parent->id) : -1,
                                          record.children.size(),
                                          record.mesh ? static_cast<int64_t>(record.mesh->id) : -1);
            }
        }

        core::Logger::Scene.debug("NodeLayout: {} nodes, {} roots, {} meshes", nodeCount,
                                  layout.m_roots.size(), layout.m_meshNodes.size());
        return layout;
    }

    glm::mat4 NodeLayout::worldTransform(NodeIndex node) const
    {
        glm::mat4 accumulated = this->node(node).localTransform;
        std::optional<NodeIndex> parent = m_nodes[node.id].parent;
        while (parent.has_value())
        {
            const NodeRecord& record = m_nodes[parent->id];
            accumulated = record.localTransform * accumulated;
            parent = record.parent;
        }
        return accumulated;
    }

    const NodeRecord& NodeLayout::node(NodeIndex node) const
    {
        if (!node.isValid() || node.id >= m_nodes.size())
        {
            throw cpptrace::logic_error("NodeLayout: node index " + std::to_string(node.id) + " out of range");
        }
        return m_nodes[node.id];
    }

    std::span<const NodeIndex> NodeLayout::meshNodes(MeshIndex mesh) const
    {
        if (!mesh.isValid() || mesh.id >= m_meshNodes.size())
        {
            return {};
        }
        return m_meshNodes[mesh.id];
    }

    std::optional<MeshIndex> NodeLayout::nodeMesh(NodeIndex node) const
    {
        return this->node(node).mesh;
    }
}
