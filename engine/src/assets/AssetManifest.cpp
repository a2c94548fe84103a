#include "kiln/assets/AssetManifest.hpp"

#include "kiln/core/logger.hpp"
#include <fstream>
#include <string>

namespace kiln::assets
{
    namespace
    {
        std::string trim(const std::string& s)
        {
            const auto first = s.find_first_not_of(" \t\r");
            if (first == std::string::npos)
            {
                return {};
            }
            const auto last = s.find_last_not_of(" \t\r");
            return s.substr(first, last - first + 1);
        }
    }

    LoadResult<AssetManifest> AssetManifest::load(const std::filesystem::path& path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return loadError(LoadErrorKind::InvalidPath, "cannot open manifest '{}'", path.string());
        }

        AssetManifest manifest;
        manifest.source = path;
        const auto baseDir = path.parent_path();

        std::string line;
        while (std::getline(file, line))
        {
            line = trim(line);
            if (line.empty() || line[0] == '#')
            {
                continue;
            }
            std::filesystem::path entry(line);
            manifest.assets.push_back(entry.is_absolute() ? entry : baseDir / entry);
        }

        core::Logger::Asset.debug("Manifest '{}': {} assets", path.string(), manifest.assets.size());
        return manifest;
    }
}
