#include "kiln/assets/AssetManifest.hpp"
#include "kiln/core/Settings.hpp"
#include "kiln/core/Timer.h"
#include "kiln/core/cvar.hpp"
#include "kiln/core/logger.hpp"
#include "kiln/renderer/AssetRegistry.hpp"
#include "kiln/renderer/RenderContext.hpp"
#include "kiln/rhi/rhi_factory.hpp"

#include <charconv>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

using namespace kiln;

namespace {

    constexpr int kExitOk = 0;
    constexpr int kExitLoadFailure = 1;
    constexpr int kExitUsage = 2;

    struct Options {
        std::optional<std::filesystem::path> cvarFile;
        std::optional<std::filesystem::path> manifest;
        std::vector<std::filesystem::path> assets;
        uint32_t frames = 1;
    };

    struct BucketStats {
        uint32_t packs = 0;
        uint64_t records = 0;
        uint64_t vertices = 0;
        uint64_t indices = 0;
        uint64_t instances = 0;
    };

    void printUsage() {
        std::fprintf(stderr,
                     "usage: scene_stats [--cvars file.ini] [--frames N] (--manifest list.txt | asset.gltf...)\n");
    }

    std::optional<Options> parseArgs(int argc, char** argv) {
        Options options;
        for (int i = 1; i < argc; ++i) {
            const std::string_view arg = argv[i];
            const bool hasValue = i + 1 < argc;

            if (arg == "--cvars" && hasValue) {
                options.cvarFile = argv[++i];
            } else if (arg == "--manifest" && hasValue) {
                options.manifest = argv[++i];
            } else if (arg == "--frames" && hasValue) {
                const std::string_view text = argv[++i];
                uint32_t frames = 0;
                auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), frames);
                if (ec != std::errc{} || ptr != text.data() + text.size() || frames == 0) {
                    core::Logger::error("--frames expects a positive integer, got '{}'", text);
                    return std::nullopt;
                }
                options.frames = frames;
            } else if (arg.starts_with("--")) {
                core::Logger::error("Unknown or incomplete option '{}'", arg);
                return std::nullopt;
            } else {
                options.assets.emplace_back(arg);
            }
        }

        if (options.manifest.has_value() == !options.assets.empty()) {
            core::Logger::error("Pass either --manifest or a list of assets");
            return std::nullopt;
        }
        return options;
    }

    void logBucket(const char* label, const BucketStats& stats, uint32_t frames) {
        core::Logger::Render.info("{:<11} packs={} records/frame={} vertices={} indices={} instances={}",
                                  label, stats.packs, stats.records / frames, stats.vertices / frames,
                                  stats.indices / frames, stats.instances / frames);
    }

}

int main(int argc, char** argv) {
    core::Logger::init();

    auto options = parseArgs(argc, argv);
    if (!options) {
        printUsage();
        core::Logger::shutdown();
        return kExitUsage;
    }

    if (options->cvarFile) {
        const int applied = core::CVarSystem::loadFromIni(*options->cvarFile);
        if (applied < 0) {
            core::Logger::error("Cannot read cvar file '{}'", options->cvarFile->string());
            core::Logger::shutdown();
            return kExitUsage;
        }
        core::Logger::info("Applied {} cvars from '{}'", applied, options->cvarFile->string());
    }
    if (core::settings::verboseAssets.get()) {
        core::Logger::setLevel(spdlog::level::debug);
    }

    std::vector<std::filesystem::path> paths = options->assets;
    if (options->manifest) {
        auto manifest = assets::AssetManifest::load(*options->manifest);
        if (!manifest) {
            core::Logger::error("{}", manifest.error().describe());
            core::Logger::shutdown();
            return kExitLoadFailure;
        }
        paths = std::move(manifest->assets);
    }

    auto device = renderer::rhi::RHIFactory::createDevice(renderer::rhi::RHIBackend::Null);
    renderer::RenderContext context(*device);
    renderer::AssetRegistry registry(context);

    core::Timer loadTimer;
    if (auto loaded = registry.load(paths); !loaded) {
        core::Logger::shutdown();
        return kExitLoadFailure;
    }
    core::Logger::info("Loaded {} models in {:.2f} ms", registry.modelCount(), loadTimer.elapsed() * 1000.0F);

    BucketStats opaque;
    BucketStats transparent;
    opaque.packs = static_cast<uint32_t>(registry.opaqueModels().size());
    transparent.packs = static_cast<uint32_t>(registry.transparentModels().size());

    core::Timer clock;
    for (uint32_t frame = 0; frame < options->frames; ++frame) {
        registry.forEachDrawRecord(clock, [&](const renderer::RegisteredModel& model,
                                              const renderer::StagedDrawRecord& record) {
            BucketStats& stats = model.pack->isTransparent() ? transparent : opaque;
            ++stats.records;
            stats.vertices += record.vertexCount;
            stats.indices += record.indexCount;
            stats.instances += record.instanceCount;
        });
    }

    core::Logger::info("Staged {} frames in {:.2f} ms", options->frames, clock.elapsed() * 1000.0F);
    logBucket("opaque", opaque, options->frames);
    logBucket("transparent", transparent, options->frames);

    core::Logger::shutdown();
    return kExitOk;
}
