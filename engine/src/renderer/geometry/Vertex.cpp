#include "kiln/renderer/geometry/Vertex.h"

#include <array>
#include <utility>

namespace kiln::renderer::VertexFeature
{
    std::string describe(uint32_t mask)
    {
        static constexpr std::array<std::pair<uint32_t, const char*>, 8> kNames = {{
            {Position, "POSITION"},
            {Normal, "NORMAL"},
            {TexCoord0, "TEX_COORD_0"},
            {TexCoord1, "TEX_COORD_1"},
            {Tangent, "TANGENT"},
            {Weight, "WEIGHT"},
            {Joint, "JOINT"},
            {Color, "COLOR"},
        }};

        std::string out;
        for (const auto& [bit, name] : kNames)
        {
            if ((mask & bit) == 0)
            {
                continue;
            }
            if (!out.empty())
            {
                out += " | ";
            }
            out += name;
        }
        return out.empty() ? "NONE" : out;
    }
}
