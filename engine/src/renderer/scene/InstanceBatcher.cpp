#include "kiln/renderer/scene/InstanceBatcher.hpp"

#include "kiln/core/common.hpp"
#include "kiln/core/logger.hpp"

namespace kiln::renderer::scene
{
    InstanceBatcher::InstanceBatcher(const NodeLayout& layout, std::span<const AnimationChannel> channels)
        : m_layout(layout)
    {
        m_nodeChannels.resize(layout.nodeCount());
        for (size_t i = 0; i < channels.size(); ++i)
        {
            const NodeIndex target = channels[i].targetNode();
            if (!target.isValid() || target.id >= m_nodeChannels.size())
            {
                throw cpptrace::logic_error("InstanceBatcher: channel " + std::to_string(i) +
                                            " targets node outside the layout");
            }
            m_nodeChannels[target.id].push_back(util::u32(i));
        }
    }

    std::span<const uint32_t> InstanceBatcher::channelsFor(NodeIndex node) const
    {
        if (!node.isValid() || node.id >= m_nodeChannels.size())
        {
            return {};
        }
        return m_nodeChannels[node.id];
    }

    InstanceBatch InstanceBatcher::batch(MeshIndex mesh) const
    {
        InstanceBatch out;
        const auto nodes = m_layout.meshNodes(mesh);
        out.nodes.assign(nodes.begin(), nodes.end());
        out.transforms.reserve(nodes.size());
        out.animations.reserve(nodes.size());

        for (NodeIndex node : nodes)
        {
            out.transforms.push_back(m_layout.worldTransform(node));
            const auto channels = channelsFor(node);
            out.animations.emplace_back(channels.begin(), channels.end());
        }

        core::Logger::Scene.trace("mesh {}: {} instances", mesh.id, out.size());
        return out;
    }
}
