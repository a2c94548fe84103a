#include "support/TestDocuments.hpp"

#include "kiln/core/Settings.hpp"
#include "kiln/core/Timer.h"
#include "kiln/renderer/PerFrameStager.hpp"
#include "kiln/rhi/rhi_factory.hpp"
#include "rhi/null/null_device.hpp"
#include "rhi/null/null_resources.hpp"
#include <array>
#include <cpptrace/cpptrace.hpp>
#include <cstring>
#include <doctest/doctest.h>
#include <format>

using namespace kiln;
using renderer::PerFrameStager;
using renderer::StagedDrawRecord;

namespace {
struct StagerFixture {
  std::unique_ptr<renderer::rhi::RHIDevice> device =
      renderer::rhi::RHIFactory::createDevice(renderer::rhi::RHIBackend::Null);
  renderer::RenderContext context{*device};

  assets::ModelAssetPack load(const tests::GlbBuilder &builder) {
    const auto bytes = builder.build();
    auto pack = assets::ModelAssetPack::fromBytes(
        context, tests::scratchDirectory("stager") / "model.glb", bytes);
    REQUIRE(pack.has_value());
    return std::move(*pack);
  }

  uint64_t buffersCreated() const {
    return dynamic_cast<const renderer::rhi::NullRHIDevice &>(*device).buffersCreated();
  }
};

std::vector<glm::mat4> instanceMatrices(const StagedDrawRecord &record) {
  auto *buffer = dynamic_cast<renderer::rhi::NullRHIBuffer *>(record.instanceBuffer.get());
  REQUIRE(buffer != nullptr);
  const auto bytes = buffer->contents();
  std::vector<glm::mat4> out(bytes.size() / sizeof(glm::mat4));
  std::memcpy(out.data(), bytes.data(), out.size() * sizeof(glm::mat4));
  return out;
}
} // namespace

TEST_CASE_FIXTURE(StagerFixture, "Static primitives are staged once") {
  const auto pack = load(tests::triangleDocument());
  PerFrameStager stager(context, pack);
  REQUIRE(stager.slotCount() == 1);
  CHECK_FALSE(stager.slot(0).has_value());

  core::ManualClock clock(0.0F);
  auto records = stager.iterate(clock);
  REQUIRE(records.size() == 1);

  const StagedDrawRecord &record = *records[0];
  CHECK(record.vertexCount == 3);
  CHECK(record.indexCount == 3);
  CHECK(record.instanceCount == 1);
  CHECK(record.isIndexed());
  CHECK(record.indexFormat == renderer::rhi::IndexFormat::Uint32);
  CHECK(record.vertexBuffer->size() == 3 * sizeof(renderer::PrimitiveVertex));
  CHECK(record.instanceBuffer->size() == sizeof(glm::mat4));
  CHECK(record.colorBindGroup == nullptr);
  CHECK(record.alphaMode == renderer::scene::AlphaMode::Opaque);
  CHECK(record.blendMode == renderer::scene::BlendMode::Replace);

  const auto *instanceBuffer = record.instanceBuffer.get();
  const uint64_t created = buffersCreated();
  clock.advance(0.5F);
  records = stager.iterate(clock);
  CHECK(records[0]->instanceBuffer.get() == instanceBuffer);
  CHECK(buffersCreated() == created);
}

TEST_CASE_FIXTURE(StagerFixture, "Animated primitives get fresh instance transforms") {
  const auto pack = load(tests::animatedDocument());
  PerFrameStager stager(context, pack);

  core::ManualClock clock(0.25F);
  auto records = stager.iterate(clock);
  REQUIRE(records.size() == 1);
  const auto *vertexBuffer = records[0]->vertexBuffer.get();
  const auto *indexBuffer = records[0]->indexBuffer.get();

  auto matrices = instanceMatrices(*records[0]);
  REQUIRE(matrices.size() == 2);
  CHECK(matrices[0][3][0] == doctest::Approx(-5.0F));
  CHECK(matrices[1][3][0] == doctest::Approx(0.5F));

  clock.set(0.75F);
  records = stager.iterate(clock);
  matrices = instanceMatrices(*records[0]);
  CHECK(matrices[0][3][0] == doctest::Approx(-5.0F));
  CHECK(matrices[1][3][0] == doctest::Approx(1.5F));

  // Geometry is shared across frames, only the instance buffer is rebuilt
  CHECK(records[0]->vertexBuffer.get() == vertexBuffer);
  CHECK(records[0]->indexBuffer.get() == indexBuffer);
  const uint64_t created = buffersCreated();
  records = stager.iterate(clock);
  CHECK(buffersCreated() == created + 1);

  SUBCASE("Evaluation loops over the channel duration") {
    const auto looped = stager.evaluateInstances(pack.primitives()[0], 1.25F);
    CHECK(looped[1][3][0] == doctest::Approx(0.5F));
  }
}

TEST_CASE_FIXTURE(StagerFixture, "Non-indexed triangle draws with one identity instance") {
  tests::GlbBuilder builder;
  static constexpr std::array<float, 9> kPositions = {0, 0, 0, 1, 0, 0, 0, 1, 0};
  const uint32_t positions = builder.addFloatAccessor(kPositions, "VEC3");
  builder.set("meshes", std::format(R"([{{"primitives":[{{"attributes":{{"POSITION":{}}}}}]}}])",
                                    positions));
  builder.set("nodes", R"([{"mesh":0}])");
  const auto pack = load(builder);
  CHECK_FALSE(pack.isTransparent());

  PerFrameStager stager(context, pack);
  core::ManualClock clock;
  auto records = stager.iterate(clock);
  REQUIRE(records.size() == 1);
  CHECK(records[0]->vertexCount == 3);
  CHECK_FALSE(records[0]->isIndexed());
  CHECK(records[0]->indexCount == 0);

  const auto matrices = instanceMatrices(*records[0]);
  REQUIRE(matrices.size() == 1);
  CHECK(matrices[0] == glm::mat4(1.0F));
}

TEST_CASE_FIXTURE(StagerFixture, "Small primitives can use 16-bit indices") {
  core::settings::compactIndices.set(true);
  const auto pack = load(tests::triangleDocument());
  PerFrameStager stager(context, pack);
  core::ManualClock clock;
  auto records = stager.iterate(clock);
  core::settings::compactIndices.reset();

  REQUIRE(records.size() == 1);
  CHECK(records[0]->indexFormat == renderer::rhi::IndexFormat::Uint16);
  CHECK(records[0]->indexBuffer->size() == 3 * sizeof(uint16_t));
}

TEST_CASE_FIXTURE(StagerFixture, "Textured primitives carry their bind group") {
  tests::GlbBuilder builder =
      tests::triangleDocument(R"([{"pbrMetallicRoughness":{"baseColorTexture":{"index":0}}}])");
  builder.addImage(tests::checkerPng());
  builder.set("textures", R"([{"source":0}])");
  const auto pack = load(builder);

  PerFrameStager stager(context, pack);
  core::ManualClock clock;
  auto records = stager.iterate(clock);
  REQUIRE(records.size() == 1);
  CHECK(records[0]->colorBindGroup == pack.colorBindGroup(0));
  CHECK(records[0]->colorBindGroup != nullptr);
}

TEST_CASE_FIXTURE(StagerFixture, "Out of range slots are programming errors") {
  const auto pack = load(tests::triangleDocument());
  PerFrameStager stager(context, pack);
  CHECK_THROWS_AS(stager.slot(1), cpptrace::logic_error);
}
