#include "kiln/core/Settings.hpp"

namespace kiln::core::settings {

AUTO_CVAR_BOOL(generateTangents, "asset.generateTangents",
               "Generate MikkTSpace tangents when a primitive has normals and UVs", true,
               CVarFlags::save);

AUTO_CVAR_BOOL(verboseAssets, "asset.verbose",
               "Log every node and primitive while loading", false);

AUTO_CVAR_BOOL(compactIndices, "render.compactIndices",
               "Stage 16-bit index buffers for small primitives", false,
               CVarFlags::save);

}
