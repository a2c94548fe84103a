#include "kiln/renderer/AssetRegistry.hpp"

#include "kiln/core/logger.hpp"
#include <cpptrace/cpptrace.hpp>

namespace kiln::renderer {

    AssetRegistry::AssetRegistry(const RenderContext& context)
        : m_context(context)
    {
    }

    assets::LoadResult<void> AssetRegistry::load(std::span<const std::filesystem::path> paths)
    {
        std::vector<assets::ModelAssetPack> loaded;
        loaded.reserve(paths.size());
        for (const auto& path : paths)
        {
            auto pack = assets::ModelAssetPack::fromPath(m_context, path);
            if (!pack)
            {
                core::Logger::Asset.error("Failed to load '{}': {}", path.string(), pack.error().describe());
                return assets::loadError(pack.error().kind, "'{}': {}", path.string(), pack.error().message);
            }
            loaded.push_back(std::move(*pack));
        }

        for (auto& pack : loaded)
        {
            add(std::move(pack));
        }
        return {};
    }

    uint32_t AssetRegistry::add(assets::ModelAssetPack pack)
    {
        RegisteredModel model;
        model.id = m_nextModelId++;
        model.pack = std::make_unique<assets::ModelAssetPack>(std::move(pack));
        model.stager = std::make_unique<PerFrameStager>(m_context, *model.pack);

        const bool transparent = model.pack->isTransparent();
        core::Logger::Render.info("Registered model {} '{}' as {}", model.id, model.pack->name(),
                                  transparent ? "transparent" : "opaque");

        const uint32_t id = model.id;
        (transparent ? m_transparent : m_opaque).push_back(std::move(model));
        return id;
    }

    PerFrameStager& AssetRegistry::stagerFor(const assets::ModelAssetPack& pack)
    {
        for (auto* bucket : {&m_opaque, &m_transparent})
        {
            for (auto& model : *bucket)
            {
                if (model.pack.get() == &pack)
                {
                    return *model.stager;
                }
            }
        }
        throw cpptrace::logic_error("AssetRegistry::stagerFor: pack '" + pack.name() + "' is not registered");
    }

    void AssetRegistry::forEachDrawRecord(const core::Clock& clock, const DrawCallback& callback)
    {
        for (auto* bucket : {&m_opaque, &m_transparent})
        {
            for (auto& model : *bucket)
            {
                for (const StagedDrawRecord* record : model.stager->iterate(clock))
                {
                    callback(model, *record);
                }
            }
        }
    }

}
