#pragma once
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "kiln/rhi/rhi_types.hpp"

namespace kiln::renderer
{
    // Which optional streams a primitive actually carried. One mask per primitive,
    // copied into every vertex so shaders can branch on it.
    namespace VertexFeature
    {
        inline constexpr uint32_t None = 0;
        inline constexpr uint32_t Position = 1U << 0;
        inline constexpr uint32_t Normal = 1U << 1;
        inline constexpr uint32_t TexCoord0 = 1U << 2;
        inline constexpr uint32_t TexCoord1 = 1U << 3;
        inline constexpr uint32_t Tangent = 1U << 4;
        inline constexpr uint32_t Weight = 1U << 5;
        inline constexpr uint32_t Joint = 1U << 6;
        inline constexpr uint32_t Color = 1U << 7;

        constexpr bool hasPosition(uint32_t mask) { return (mask & Position) != 0; }
        constexpr bool hasNormal(uint32_t mask) { return (mask & Normal) != 0; }
        constexpr bool hasTexCoord0(uint32_t mask) { return (mask & TexCoord0) != 0; }
        constexpr bool hasTexCoord1(uint32_t mask) { return (mask & TexCoord1) != 0; }
        constexpr bool hasAnyTexCoord(uint32_t mask) { return (mask & (TexCoord0 | TexCoord1)) != 0; }
        constexpr bool hasTangent(uint32_t mask) { return (mask & Tangent) != 0; }
        constexpr bool hasWeight(uint32_t mask) { return (mask & Weight) != 0; }
        constexpr bool hasJoint(uint32_t mask) { return (mask & Joint) != 0; }
        constexpr bool hasColor(uint32_t mask) { return (mask & Color) != 0; }

        // "POSITION | NORMAL | TEX_COORD_0", or "NONE"
        std::string describe(uint32_t mask);
    }

    // std430 layout; every vec3 is padded out to 16 bytes
    struct alignas(16) PrimitiveVertex
    {
        glm::vec3 m_position{0.0F};
        float m_pad0 = 0.0F;
        glm::vec3 m_normal{1.0F, 1.0F, 1.0F};
        float m_pad1 = 0.0F;
        glm::vec2 m_texCoord0{0.0F};
        glm::vec2 m_texCoord1{0.0F};
        glm::vec4 m_tangent{1.0F, 1.0F, 1.0F, 1.0F};
        glm::vec4 m_weights{0.0F};
        glm::uvec4 m_joints{0U};
        glm::vec4 m_color{1.0F};
        uint32_t m_featureMask = VertexFeature::None;
        uint32_t m_pad2[3] = {0, 0, 0};

        struct AttributeLayout
        {
            uint32_t m_location;
            uint32_t m_offset;
            rhi::Format m_format;
        };

        static std::vector<AttributeLayout> getLayout()
        {
            return {
                {0, offsetof(PrimitiveVertex, m_position), rhi::Format::R32G32B32_SFLOAT},
                {1, offsetof(PrimitiveVertex, m_normal), rhi::Format::R32G32B32_SFLOAT},
                {2, offsetof(PrimitiveVertex, m_texCoord0), rhi::Format::R32G32_SFLOAT},
                {3, offsetof(PrimitiveVertex, m_texCoord1), rhi::Format::R32G32_SFLOAT},
                {4, offsetof(PrimitiveVertex, m_tangent), rhi::Format::R32G32B32A32_SFLOAT},
                {5, offsetof(PrimitiveVertex, m_weights), rhi::Format::R32G32B32A32_SFLOAT},
                {6, offsetof(PrimitiveVertex, m_joints), rhi::Format::R32G32B32A32_UINT},
                {7, offsetof(PrimitiveVertex, m_color), rhi::Format::R32G32B32A32_SFLOAT}
            };
        }
    };

    static_assert(sizeof(PrimitiveVertex) == 128, "PrimitiveVertex must match the std430 shader layout");
    static_assert(offsetof(PrimitiveVertex, m_normal) == 16);
    static_assert(offsetof(PrimitiveVertex, m_tangent) == 48);
    static_assert(offsetof(PrimitiveVertex, m_featureMask) == 112);
} // namespace kiln::renderer
