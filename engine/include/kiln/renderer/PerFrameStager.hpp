#pragma once

#include "kiln/assets/ModelAssetPack.hpp"
#include "kiln/core/Timer.h"
#include "kiln/renderer/RenderContext.hpp"
#include "kiln/renderer/scene/Material.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace kiln::renderer {

    // GPU-side state for drawing one primitive with all of its instances
    struct StagedDrawRecord {
        std::unique_ptr<rhi::RHIBuffer> vertexBuffer;
        std::unique_ptr<rhi::RHIBuffer> indexBuffer; // null for non-indexed primitives
        rhi::IndexFormat indexFormat = rhi::IndexFormat::Uint32;
        std::unique_ptr<rhi::RHIBuffer> instanceBuffer; // one column-major mat4 per instance

        uint32_t vertexCount = 0;
        uint32_t indexCount = 0;
        uint32_t instanceCount = 0;

        rhi::RHIDescriptorSet* colorBindGroup = nullptr; // owned by the pack

        uint32_t primitiveId = 0;
        scene::AlphaMode alphaMode = scene::AlphaMode::Opaque;
        scene::BlendMode blendMode = scene::BlendMode::Replace;

        bool isIndexed() const { return indexBuffer != nullptr; }
    };

    // Per-pack cache of draw records. Static primitives are staged once;
    // animated ones get a fresh instance buffer every refresh.
    class PerFrameStager {
    public:
        PerFrameStager(const RenderContext& context, const assets::ModelAssetPack& pack);

        void refresh(size_t primitiveIndex, const core::Clock& clock);

        // Refreshes every primitive, then returns the records in primitive order
        std::vector<const StagedDrawRecord*> iterate(const core::Clock& clock);

        const std::optional<StagedDrawRecord>& slot(size_t primitiveIndex) const;
        size_t slotCount() const { return m_slots.size(); }

        // Instance transforms of primitive at time seconds
        std::vector<glm::mat4> evaluateInstances(const assets::PackedPrimitive& primitive, float time) const;

    private:
        void stage(size_t primitiveIndex, float time);
        std::unique_ptr<rhi::RHIBuffer> createInstanceBuffer(const assets::PackedPrimitive& primitive,
                                                             float time) const;

        const RenderContext& m_context;
        const assets::ModelAssetPack& m_pack;
        std::vector<std::optional<StagedDrawRecord>> m_slots;
    };

}
