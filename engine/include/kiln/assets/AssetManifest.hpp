#pragma once

#include "kiln/assets/LoadError.hpp"
#include <filesystem>
#include <vector>

namespace kiln::assets
{
    // Ordered list of assets to load, one path per line. Blank lines and lines
    // starting with '#' are ignored; relative paths resolve against the
    // manifest's directory.
    struct AssetManifest
    {
        std::filesystem::path source;
        std::vector<std::filesystem::path> assets;

        static LoadResult<AssetManifest> load(const std::filesystem::path& path);
    };
}
