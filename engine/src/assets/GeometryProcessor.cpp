#include "kiln/assets/GeometryProcessor.hpp"
#include "kiln/core/logger.hpp"
#include <mikktspace.h>
#include <glm/vec4.hpp>

namespace kiln::assets {

    namespace {
        struct TangentContext {
            std::vector<renderer::PrimitiveVertex>* m_vertices;
            const std::vector<uint32_t>* m_indices;
            uint32_t m_uvSet;

            size_t vertexIndex(const int iFace, const int iVert) const {
                const auto corner = static_cast<size_t>((iFace * 3) + iVert);
                return m_indices != nullptr ? (*m_indices)[corner] : corner;
            }

            size_t cornerCount() const {
                return m_indices != nullptr ? m_indices->size() : m_vertices->size();
            }

            static int getNumFaces(const SMikkTSpaceContext* context) {
                auto* user = static_cast<TangentContext*>(context->m_pUserData);
                return static_cast<int>(user->cornerCount() / 3);
            }

            static int getNumVerticesOfFace(const SMikkTSpaceContext*, const int) {
                return 3;
            }

            static void getPosition(const SMikkTSpaceContext* context, float fvPosOut[], const int iFace, const int iVert) {
                auto* user = static_cast<TangentContext*>(context->m_pUserData);
                const auto& pos = (*user->m_vertices)[user->vertexIndex(iFace, iVert)].m_position;
                fvPosOut[0] = pos.x;
                fvPosOut[1] = pos.y;
                fvPosOut[2] = pos.z;
            }

            static void getNormal(const SMikkTSpaceContext* context, float fvNormOut[], const int iFace, const int iVert) {
                auto* user = static_cast<TangentContext*>(context->m_pUserData);
                const auto& norm = (*user->m_vertices)[user->vertexIndex(iFace, iVert)].m_normal;
                fvNormOut[0] = norm.x;
                fvNormOut[1] = norm.y;
                fvNormOut[2] = norm.z;
            }

            static void getTexCoord(const SMikkTSpaceContext* context, float fvTexcOut[], const int iFace, const int iVert) {
                auto* user = static_cast<TangentContext*>(context->m_pUserData);
                const auto& vertex = (*user->m_vertices)[user->vertexIndex(iFace, iVert)];
                const auto& uv = user->m_uvSet == 1 ? vertex.m_texCoord1 : vertex.m_texCoord0;
                fvTexcOut[0] = uv.x;
                fvTexcOut[1] = uv.y;
            }

            static void setTSpaceBasic(const SMikkTSpaceContext* context, const float fvTangent[], const float fSign, const int iFace, const int iVert) {
                auto* user = static_cast<TangentContext*>(context->m_pUserData);
                (*user->m_vertices)[user->vertexIndex(iFace, iVert)].m_tangent =
                    glm::vec4(fvTangent[0], fvTangent[1], fvTangent[2], fSign);
            }
        };
    }

    bool GeometryProcessor::generateTangents(std::vector<renderer::PrimitiveVertex>& vertices,
                                             const std::optional<std::vector<uint32_t>>& indices,
                                             uint32_t uvSet) {
        if (indices.has_value() && indices->size() % 3 != 0) {
            core::Logger::Asset.warn("Tangent generation skipped: {} indices is not a triangle list", indices->size());
            return false;
        }
        if (!indices.has_value() && vertices.size() % 3 != 0) {
            core::Logger::Asset.warn("Tangent generation skipped: {} unindexed vertices is not a triangle list", vertices.size());
            return false;
        }

        TangentContext userContext{};
        userContext.m_vertices = &vertices;
        userContext.m_indices = indices.has_value() ? &indices.value() : nullptr;
        userContext.m_uvSet = uvSet;

        SMikkTSpaceInterface iface{};
        iface.m_getNumFaces = TangentContext::getNumFaces;
        iface.m_getNumVerticesOfFace = TangentContext::getNumVerticesOfFace;
        iface.m_getPosition = TangentContext::getPosition;
        iface.m_getNormal = TangentContext::getNormal;
        iface.m_getTexCoord = TangentContext::getTexCoord;
        iface.m_setTSpaceBasic = TangentContext::setTSpaceBasic;

        SMikkTSpaceContext context{};
        context.m_pInterface = &iface;
        context.m_pUserData = &userContext;

        core::Logger::Asset.debug("Generating tangents for {} vertices ({} indices, uv set {})",
                                  vertices.size(), indices ? indices->size() : 0, uvSet);
        return genTangSpaceDefault(&context) != 0;
    }

}
