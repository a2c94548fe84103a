#pragma once

#include "kiln/assets/LoadError.hpp"
#include "kiln/core/Handle.h"
#include "kiln/renderer/scene/Animation.hpp"
#include "kiln/renderer/scene/InstanceBatcher.hpp"
#include "kiln/renderer/scene/Mesh.hpp"
#include "kiln/renderer/scene/NodeLayout.hpp"
#include <cstdint>
#include <span>

namespace fastgltf { class Asset; }

namespace kiln::assets
{
    // State owned by one load invocation
    struct AssemblyContext
    {
        uint32_t m_nextPrimitiveId = 0;

        uint32_t nextPrimitiveId() { return m_nextPrimitiveId++; }
    };

    // Turns document meshes into primitives in the PrimitiveVertex format
    class MeshAssembler
    {
    public:
        static LoadResult<renderer::scene::Mesh> parse(const renderer::scene::NodeLayout& layout,
                                                       std::span<const renderer::scene::AnimationChannel> channels,
                                                       const fastgltf::Asset& gltf,
                                                       MeshIndex mesh,
                                                       AssemblyContext& context);

        // Same, reusing a batcher built once for the whole document
        static LoadResult<renderer::scene::Mesh> parse(const renderer::scene::InstanceBatcher& batcher,
                                                       const fastgltf::Asset& gltf,
                                                       MeshIndex mesh,
                                                       AssemblyContext& context);
    };
}
