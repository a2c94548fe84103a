#pragma once

#include "kiln/renderer/geometry/Vertex.h"
#include <cstdint>
#include <optional>
#include <vector>

namespace kiln::assets {

    class GeometryProcessor {
    public:
        // MikkTSpace tangents over triangle lists (indexed, or sequential triples).
        // Reads uvSet 0 or 1. Returns false, leaving vertices untouched, when the
        // topology is not a whole number of triangles.
        static bool generateTangents(std::vector<renderer::PrimitiveVertex>& vertices,
                                     const std::optional<std::vector<uint32_t>>& indices,
                                     uint32_t uvSet = 0);
    };

}
