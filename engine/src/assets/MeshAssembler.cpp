#include "kiln/assets/MeshAssembler.hpp"

#include "kiln/assets/GeometryProcessor.hpp"
#include "kiln/core/Settings.hpp"
#include "kiln/core/common.hpp"
#include "kiln/core/logger.hpp"
#include <fastgltf/glm_element_traits.hpp>
#include <fastgltf/tools.hpp>
#include <fastgltf/types.hpp>

namespace kiln::assets
{
    using renderer::PrimitiveVertex;
    using renderer::scene::Aabb;
    using renderer::scene::InstanceBatch;
    using renderer::scene::Material;
    using renderer::scene::Mesh;
    using renderer::scene::Primitive;
    namespace VertexFeature = renderer::VertexFeature;

    namespace
    {
        // nullptr when the primitive does not carry the attribute
        LoadResult<const fastgltf::Accessor*> findAccessor(const fastgltf::Asset& gltf,
                                                           const fastgltf::Primitive& gPrim,
                                                           std::string_view name,
                                                           std::optional<size_t> expectedCount)
        {
            const auto it = gPrim.findAttribute(name);
            if (it == gPrim.attributes.end())
            {
                return static_cast<const fastgltf::Accessor*>(nullptr);
            }
            if (it->accessorIndex >= gltf.accessors.size())
            {
                return loadError(LoadErrorKind::MalformedDocument, "{} uses accessor {} (only {})", name,
                                 it->accessorIndex, gltf.accessors.size());
            }
            const auto& accessor = gltf.accessors[it->accessorIndex];
            if (expectedCount && accessor.count != *expectedCount)
            {
                return loadError(LoadErrorKind::MalformedDocument, "{} has {} elements but POSITION has {}", name,
                                 accessor.count, *expectedCount);
            }
            return &accessor;
        }

        std::optional<glm::vec3> boundsToVec3(const std::optional<fastgltf::AccessorBoundsArray>& bounds)
        {
            if (!bounds || bounds->size() < 3)
            {
                return std::nullopt;
            }
            glm::vec3 out{};
            for (size_t i = 0; i < 3; ++i)
            {
                out[static_cast<glm::length_t>(i)] =
                    bounds->isType<double>() ? static_cast<float>(bounds->get<double>(i))
                                             : static_cast<float>(bounds->get<std::int64_t>(i));
            }
            return out;
        }

        LoadResult<std::vector<uint32_t>> readIndices(const fastgltf::Asset& gltf, size_t accessorIndex,
                                                      size_t vertexCount)
        {
            if (accessorIndex >= gltf.accessors.size())
            {
                return loadError(LoadErrorKind::MalformedDocument, "indices use accessor {} (only {})",
                                 accessorIndex, gltf.accessors.size());
            }
            const auto& acc = gltf.accessors[accessorIndex];
            std::vector<uint32_t> indices(acc.count);
            if (acc.componentType == fastgltf::ComponentType::UnsignedByte)
            {
                fastgltf::iterateAccessorWithIndex<std::uint8_t>(gltf, acc, [&](std::uint8_t v, size_t i)
                {
                    indices[i] = v;
                });
            }
            else if (acc.componentType == fastgltf::ComponentType::UnsignedShort)
            {
                fastgltf::iterateAccessorWithIndex<std::uint16_t>(gltf, acc, [&](std::uint16_t v, size_t i)
                {
                    indices[i] = v;
                });
            }
            else
            {
                fastgltf::iterateAccessorWithIndex<std::uint32_t>(gltf, acc, [&](std::uint32_t v, size_t i)
                {
                    indices[i] = v;
                });
            }

            for (size_t i = 0; i < indices.size(); ++i)
            {
                if (indices[i] >= vertexCount)
                {
                    return loadError(LoadErrorKind::MalformedDocument, "index {} at position {} exceeds {} vertices",
                                     indices[i], i, vertexCount);
                }
            }
            return indices;
        }

        LoadResult<Primitive> assemblePrimitive(const fastgltf::Asset& gltf, const fastgltf::Primitive& gPrim,
                                                MeshIndex mesh, const InstanceBatch& instances,
                                                AssemblyContext& context)
        {
            Primitive prim;
            prim.id = context.nextPrimitiveId();

            auto material = Material::fromGltf(gltf, gPrim.materialIndex.has_value()
                                                         ? std::optional<size_t>(gPrim.materialIndex.value())
                                                         : std::nullopt);
            if (!material)
            {
                return core::Unexpected<LoadError>(std::move(material.error()));
            }
            prim.material = std::move(*material);

            auto positions = findAccessor(gltf, gPrim, "POSITION", std::nullopt);
            if (!positions)
            {
                return core::Unexpected<LoadError>(std::move(positions.error()));
            }
            if (*positions == nullptr)
            {
                return loadError(LoadErrorKind::MalformedDocument, "mesh {} primitive {} has no POSITION", mesh.id,
                                 prim.id);
            }
            const fastgltf::Accessor& posAccessor = **positions;
            const size_t vCount = posAccessor.count;
            if (!util::checkedU32(vCount))
            {
                return loadError(LoadErrorKind::HandleOverflow, "mesh {} primitive has {} vertices", mesh.id, vCount);
            }

            PrimitiveVertex defaults{};
            defaults.m_color = prim.material.baseColorFactor;
            prim.vertices.assign(vCount, defaults);

            uint32_t mask = vCount > 0 ? VertexFeature::Position : VertexFeature::None;

            fastgltf::iterateAccessorWithIndex<glm::vec3>(gltf, posAccessor, [&](glm::vec3 pos, size_t idx)
            {
                prim.vertices[idx].m_position = pos;
            });

            struct OptionalStream
            {
                std::string_view name;
                uint32_t feature;
            };
            constexpr OptionalStream streams[] = {
                {"NORMAL", VertexFeature::Normal},
                {"TANGENT", VertexFeature::Tangent},
                {"TEXCOORD_0", VertexFeature::TexCoord0},
                {"TEXCOORD_1", VertexFeature::TexCoord1},
                {"WEIGHTS_0", VertexFeature::Weight},
                {"JOINTS_0", VertexFeature::Joint},
                {"COLOR_0", VertexFeature::Color},
            };

            for (const auto& stream : streams)
            {
                auto found = findAccessor(gltf, gPrim, stream.name, vCount);
                if (!found)
                {
                    return core::Unexpected<LoadError>(std::move(found.error()));
                }
                const fastgltf::Accessor* accessor = *found;
                if (accessor == nullptr)
                {
                    continue;
                }
                mask |= stream.feature;

                switch (stream.feature)
                {
                case VertexFeature::Normal:
                    fastgltf::iterateAccessorWithIndex<glm::vec3>(gltf, *accessor, [&](glm::vec3 n, size_t idx)
                    {
                        prim.vertices[idx].m_normal = n;
                    });
                    break;
                case VertexFeature::Tangent:
                    fastgltf::iterateAccessorWithIndex<glm::vec4>(gltf, *accessor, [&](glm::vec4 t, size_t idx)
                    {
                        prim.vertices[idx].m_tangent = t;
                    });
                    break;
                case VertexFeature::TexCoord0:
                    fastgltf::iterateAccessorWithIndex<glm::vec2>(gltf, *accessor, [&](glm::vec2 uv, size_t idx)
                    {
                        prim.vertices[idx].m_texCoord0 = uv;
                    });
                    break;
                case VertexFeature::TexCoord1:
                    fastgltf::iterateAccessorWithIndex<glm::vec2>(gltf, *accessor, [&](glm::vec2 uv, size_t idx)
                    {
                        prim.vertices[idx].m_texCoord1 = uv;
                    });
                    break;
                case VertexFeature::Weight:
                    fastgltf::iterateAccessorWithIndex<glm::vec4>(gltf, *accessor, [&](glm::vec4 w, size_t idx)
                    {
                        prim.vertices[idx].m_weights = w;
                    });
                    break;
                case VertexFeature::Joint:
                    fastgltf::iterateAccessorWithIndex<glm::uvec4>(gltf, *accessor, [&](glm::uvec4 j, size_t idx)
                    {
                        prim.vertices[idx].m_joints = j;
                    });
                    break;
                case VertexFeature::Color:
                    if (accessor->type == fastgltf::AccessorType::Vec4)
                    {
                        fastgltf::iterateAccessorWithIndex<glm::vec4>(gltf, *accessor, [&](glm::vec4 c, size_t idx)
                        {
                            prim.vertices[idx].m_color = c;
                        });
                    }
                    else
                    {
                        fastgltf::iterateAccessorWithIndex<glm::vec3>(gltf, *accessor, [&](glm::vec3 c, size_t idx)
                        {
                            prim.vertices[idx].m_color = glm::vec4(c, 1.0F);
                        });
                    }
                    break;
                default:
                    break;
                }
            }

            // Tinted materials go through the vertex color path
            if (!prim.material.hasDefaultBaseColor())
            {
                mask |= VertexFeature::Color;
            }
            for (auto& v : prim.vertices)
            {
                v.m_featureMask = mask;
            }

            if (gPrim.indicesAccessor.has_value())
            {
                auto indices = readIndices(gltf, gPrim.indicesAccessor.value(), vCount);
                if (!indices)
                {
                    return core::Unexpected<LoadError>(std::move(indices.error()));
                }
                prim.indices = std::move(*indices);
            }

            const bool triangles = gPrim.type == fastgltf::PrimitiveType::Triangles;
            if (!triangles)
            {
                core::Logger::Asset.warn("mesh {} primitive {} is not a triangle list, assembled as is", mesh.id,
                                         prim.id);
            }

            const bool wantsTangents = !prim.vertices.empty() && VertexFeature::hasNormal(mask) &&
                                       VertexFeature::hasAnyTexCoord(mask) && !VertexFeature::hasTangent(mask);
            if (wantsTangents && triangles && core::settings::generateTangents.get())
            {
                const uint32_t uvSet = VertexFeature::hasTexCoord0(mask) ? 0U : 1U;
                if (!GeometryProcessor::generateTangents(prim.vertices, prim.indices, uvSet))
                {
                    core::Logger::Asset.warn("mesh {} primitive {}: tangent generation failed, defaults kept",
                                             mesh.id, prim.id);
                }
            }
            else if (!VertexFeature::hasTangent(mask))
            {
                core::Logger::Asset.debug("mesh {} primitive {}: default tangents kept ({})", mesh.id, prim.id,
                                          VertexFeature::describe(mask));
            }

            const auto lo = boundsToVec3(posAccessor.min);
            const auto hi = boundsToVec3(posAccessor.max);
            if (lo && hi)
            {
                prim.aabb = Aabb::fromMinMax(*lo, *hi);
            }
            else
            {
                for (const auto& v : prim.vertices)
                {
                    prim.aabb.expand(v.m_position);
                }
            }

            prim.instanceNodes = instances.nodes;
            prim.instanceTransforms = instances.transforms;
            prim.instanceAnimations = instances.animations;

            if (core::settings::verboseAssets.get())
            {
                core::Logger::Asset.debug("  primitive {}: {} vertices, {} indices, {} instances, [{}]", prim.id,
                                          prim.vertices.size(), prim.indices ? prim.indices->size() : 0,
                                          prim.instanceCount(), VertexFeature::describe(mask));
            }
            return prim;
        }
    }

    LoadResult<Mesh> MeshAssembler::parse(const renderer::scene::NodeLayout& layout,
                                          std::span<const renderer::scene::AnimationChannel> channels,
                                          const fastgltf::Asset& gltf,
                                          MeshIndex mesh,
                                          AssemblyContext& context)
    {
        const renderer::scene::InstanceBatcher batcher(layout, channels);
        return parse(batcher, gltf, mesh, context);
    }

    LoadResult<Mesh> MeshAssembler::parse(const renderer::scene::InstanceBatcher& batcher,
                                          const fastgltf::Asset& gltf,
                                          MeshIndex mesh,
                                          AssemblyContext& context)
    {
        if (!mesh.isValid() || mesh.id >= gltf.meshes.size())
        {
            return loadError(LoadErrorKind::MalformedDocument, "mesh {} out of range (only {})", mesh.id,
                             gltf.meshes.size());
        }
        const auto& gMesh = gltf.meshes[mesh.id];

        Mesh out;
        out.index = mesh;
        out.name = std::string(gMesh.name);

        const InstanceBatch instances = batcher.batch(mesh);
        if (instances.empty())
        {
            core::Logger::Asset.debug("Mesh {} '{}' is not instanced by any node, skipped", mesh.id, out.name);
            return out;
        }

        out.primitives.reserve(gMesh.primitives.size());
        for (const auto& gPrim : gMesh.primitives)
        {
            auto prim = assemblePrimitive(gltf, gPrim, mesh, instances, context);
            if (!prim)
            {
                return core::Unexpected<LoadError>(std::move(prim.error()));
            }
            out.aabb.unite(prim->aabb);
            out.primitives.push_back(std::move(*prim));
        }

        core::Logger::Asset.debug("Mesh {} '{}': {} primitives, {} instances", mesh.id, out.name,
                                  out.primitives.size(), instances.size());
        return out;
    }
}
