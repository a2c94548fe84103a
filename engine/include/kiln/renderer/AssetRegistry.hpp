#pragma once

#include "kiln/assets/LoadError.hpp"
#include "kiln/assets/ModelAssetPack.hpp"
#include "kiln/core/Timer.h"
#include "kiln/renderer/PerFrameStager.hpp"
#include "kiln/renderer/RenderContext.hpp"
#include <filesystem>
#include <functional>
#include <memory>
#include <span>
#include <vector>

namespace kiln::renderer {

    struct RegisteredModel {
        uint32_t id = 0;
        std::unique_ptr<assets::ModelAssetPack> pack;
        std::unique_ptr<PerFrameStager> stager;
    };

    // Owns every loaded pack, bucketed for opaque-then-transparent submission
    class AssetRegistry {
    public:
        using DrawCallback = std::function<void(const RegisteredModel&, const StagedDrawRecord&)>;

        explicit AssetRegistry(const RenderContext& context);

        // Loads every path in order. Either all packs are registered or, on the
        // first failure, none are.
        assets::LoadResult<void> load(std::span<const std::filesystem::path> paths);

        // Returns the model id
        uint32_t add(assets::ModelAssetPack pack);

        std::span<const RegisteredModel> opaqueModels() const { return m_opaque; }
        std::span<const RegisteredModel> transparentModels() const { return m_transparent; }
        size_t modelCount() const { return m_opaque.size() + m_transparent.size(); }

        PerFrameStager& stagerFor(const assets::ModelAssetPack& pack);

        // Opaque packs first, then transparent ones, each in load order
        void forEachDrawRecord(const core::Clock& clock, const DrawCallback& callback);

    private:
        const RenderContext& m_context;
        std::vector<RegisteredModel> m_opaque;
        std::vector<RegisteredModel> m_transparent;
        uint32_t m_nextModelId = 0;
    };

}
