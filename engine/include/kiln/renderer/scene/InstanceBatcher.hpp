#pragma once

#include "kiln/renderer/scene/Animation.hpp"
#include "kiln/renderer/scene/Mesh.hpp"
#include "kiln/renderer/scene/NodeLayout.hpp"
#include <span>

namespace kiln::renderer::scene
{
    struct InstanceBatch
    {
        std::vector<NodeIndex> nodes;
        std::vector<glm::mat4> transforms;
        std::vector<ChannelList> animations;

        size_t size() const { return nodes.size(); }
        bool empty() const { return nodes.empty(); }
    };

    // Expands a mesh into one instance per node referencing it. Both the layout
    // and the channel list must outlive the batcher.
    class InstanceBatcher
    {
    public:
        InstanceBatcher(const NodeLayout& layout, std::span<const AnimationChannel> channels);

        InstanceBatch batch(MeshIndex mesh) const;

        // Channel indices targeting node, in document order
        std::span<const uint32_t> channelsFor(NodeIndex node) const;

    private:
        const NodeLayout& m_layout;
        std::vector<ChannelList> m_nodeChannels;
    };
}
