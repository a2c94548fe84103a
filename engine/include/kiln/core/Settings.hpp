#pragma once

#include "kiln/core/cvar.hpp"

namespace kiln::core::settings {

    // MikkTSpace tangents for primitives that ship normals and UVs but no TANGENT
    extern CVar<bool> generateTangents;

    // Per-node / per-primitive debug logs while loading
    extern CVar<bool> verboseAssets;

    // u16 index buffers for primitives with at most 65535 vertices
    extern CVar<bool> compactIndices;

}
