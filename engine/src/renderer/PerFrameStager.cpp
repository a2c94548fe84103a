#include "kiln/renderer/PerFrameStager.hpp"

#include "kiln/core/Settings.hpp"
#include "kiln/core/common.hpp"
#include "kiln/core/logger.hpp"
#include <cstring>
#include <limits>

namespace kiln::renderer {

    PerFrameStager::PerFrameStager(const RenderContext& context, const assets::ModelAssetPack& pack)
        : m_context(context), m_pack(pack)
    {
        m_slots.resize(m_pack.primitiveCount());
    }

    const std::optional<StagedDrawRecord>& PerFrameStager::slot(size_t primitiveIndex) const
    {
        if (primitiveIndex >= m_slots.size())
        {
            throw cpptrace::logic_error("PerFrameStager::slot: primitive " + std::to_string(primitiveIndex) +
                                        " out of range");
        }
        return m_slots[primitiveIndex];
    }

    std::vector<glm::mat4> PerFrameStager::evaluateInstances(const assets::PackedPrimitive& primitive,
                                                             float time) const
    {
        std::vector<glm::mat4> transforms = primitive.instanceTransforms;
        const auto channels = m_pack.channels();
        for (size_t i = 0; i < transforms.size(); ++i)
        {
            for (uint32_t channelIdx : primitive.instanceAnimations[i])
            {
                transforms[i] = transforms[i] * scene::toMatrix(channels[channelIdx].interpolate(time));
            }
        }
        return transforms;
    }

    std::unique_ptr<rhi::RHIBuffer> PerFrameStager::createInstanceBuffer(const assets::PackedPrimitive& primitive,
                                                                         float time) const
    {
        const std::vector<glm::mat4> transforms = evaluateInstances(primitive, time);

        rhi::BufferDescriptor desc{};
        desc.size = transforms.size() * sizeof(glm::mat4);
        desc.usage = rhi::BufferUsage::VertexBuffer | rhi::BufferUsage::StorageBuffer;
        desc.memoryUsage = rhi::MemoryUsage::CPUToGPU;
        desc.data = std::as_bytes(std::span(transforms));
        desc.debugName = "Instance Transforms";
        return m_context.device().createBuffer(desc);
    }

    void PerFrameStager::stage(size_t primitiveIndex, float time)
    {
        const auto& primitive = m_pack.primitives()[primitiveIndex];
        auto& device = m_context.device();

        StagedDrawRecord record{};
        record.primitiveId = primitive.id;
        record.alphaMode = primitive.material.alphaMode;
        record.blendMode = primitive.material.blendMode();
        record.vertexCount = primitive.vertexRange.count();
        record.instanceCount = primitive.instanceCount();

        const auto vertices = m_pack.primitiveVertices(primitive);
        rhi::BufferDescriptor vertexDesc{};
        vertexDesc.size = vertices.size_bytes();
        vertexDesc.usage = rhi::BufferUsage::VertexBuffer | rhi::BufferUsage::TransferDst;
        vertexDesc.memoryUsage = rhi::MemoryUsage::GPUOnly;
        vertexDesc.data = std::as_bytes(vertices);
        vertexDesc.debugName = "Vertex Buffer";
        record.vertexBuffer = device.createBuffer(vertexDesc);

        if (primitive.indexRange)
        {
            const auto indices = m_pack.primitiveIndices(primitive);
            record.indexCount = util::u32(indices.size());

            rhi::BufferDescriptor indexDesc{};
            indexDesc.usage = rhi::BufferUsage::IndexBuffer | rhi::BufferUsage::TransferDst;
            indexDesc.memoryUsage = rhi::MemoryUsage::GPUOnly;
            indexDesc.debugName = "Index Buffer";

            const bool compact = core::settings::compactIndices.get() &&
                                 record.vertexCount <= std::numeric_limits<uint16_t>::max();
            std::vector<uint16_t> narrow;
            if (compact)
            {
                narrow.reserve(indices.size());
                for (uint32_t index : indices)
                {
                    narrow.push_back(static_cast<uint16_t>(index));
                }
                record.indexFormat = rhi::IndexFormat::Uint16;
                indexDesc.data = std::as_bytes(std::span<const uint16_t>(narrow));
            }
            else
            {
                record.indexFormat = rhi::IndexFormat::Uint32;
                indexDesc.data = std::as_bytes(indices);
            }
            indexDesc.size = indexDesc.data.size();
            record.indexBuffer = device.createBuffer(indexDesc);
        }

        record.instanceBuffer = createInstanceBuffer(primitive, time);

        if (const auto& color = primitive.material.baseColorTexture)
        {
            record.colorBindGroup = m_pack.colorBindGroup(color->textureIndex);
        }

        core::Logger::Render.trace("Staged primitive {}: {} vertices, {} indices, {} instances", primitive.id,
                                   record.vertexCount, record.indexCount, record.instanceCount);
        m_slots[primitiveIndex] = std::move(record);
    }

    void PerFrameStager::refresh(size_t primitiveIndex, const core::Clock& clock)
    {
        KILN_ASSERT(primitiveIndex < m_pack.primitiveCount(), "primitive index out of range");
        if (primitiveIndex >= m_pack.primitiveCount())
        {
            throw cpptrace::logic_error("PerFrameStager::refresh: primitive " + std::to_string(primitiveIndex) +
                                        " out of range (" + std::to_string(m_pack.primitiveCount()) + ")");
        }
        auto& slot = m_slots[primitiveIndex];
        const auto& primitive = m_pack.primitives()[primitiveIndex];
        if (!slot.has_value())
        {
            stage(primitiveIndex, clock.elapsed());
        }
        else if (primitive.isAnimated())
        {
            slot->instanceBuffer = createInstanceBuffer(primitive, clock.elapsed());
        }
    }

    std::vector<const StagedDrawRecord*> PerFrameStager::iterate(const core::Clock& clock)
    {
        std::vector<const StagedDrawRecord*> records;
        records.reserve(m_pack.primitiveCount());
        for (size_t i = 0; i < m_pack.primitiveCount(); ++i)
        {
            refresh(i, clock);
            if (m_slots[i].has_value())
            {
                records.push_back(&m_slots[i].value());
            }
        }
        return records;
    }

}
