#include "support/TestDocuments.hpp"

#include "kiln/assets/ModelAssetPack.hpp"
#include "kiln/renderer/RenderContext.hpp"
#include "kiln/rhi/rhi_factory.hpp"
#include "rhi/null/null_device.hpp"
#include "rhi/null/null_resources.hpp"
#include <array>
#include <doctest/doctest.h>
#include <filesystem>
#include <format>
#include <fstream>

using namespace kiln;
using assets::LoadErrorKind;
using assets::ModelAssetPack;
using kiln::tests::GlbBuilder;

namespace {
struct PackFixture {
  std::unique_ptr<renderer::rhi::RHIDevice> device =
      renderer::rhi::RHIFactory::createDevice(renderer::rhi::RHIBackend::Null);
  renderer::RenderContext context{*device};
  std::filesystem::path dir = tests::scratchDirectory("model_asset_pack");

  assets::LoadResult<ModelAssetPack> load(const GlbBuilder &builder,
                                          const std::string &name = "model.glb") {
    const auto bytes = builder.build();
    return ModelAssetPack::fromBytes(context, dir / name, bytes);
  }

  LoadErrorKind failureOf(const GlbBuilder &builder) {
    auto pack = load(builder);
    REQUIRE_FALSE(pack.has_value());
    return pack.error().kind;
  }
};

GlbBuilder texturedDocument(std::vector<std::byte> png, const std::string &alphaMode = "OPAQUE") {
  GlbBuilder builder = tests::triangleDocument(std::format(
      R"([{{"name":"painted","alphaMode":"{}","pbrMetallicRoughness":{{"baseColorTexture":{{"index":0}}}}}}])",
      alphaMode));
  builder.addImage(png);
  builder.set("textures", R"([{"source":0}])");
  return builder;
}
} // namespace

TEST_CASE_FIXTURE(PackFixture, "Single triangle pack") {
  auto pack = load(tests::triangleDocument(), "triangle.glb");
  REQUIRE(pack.has_value());

  CHECK(pack->name() == "triangle.glb");
  CHECK(pack->path() == dir / "triangle.glb");
  CHECK(pack->meshCount() == 1);
  CHECK(pack->vertices().size() == 3);
  CHECK(pack->indices().size() == 3);
  REQUIRE(pack->primitiveCount() == 1);

  const auto &prim = pack->primitives()[0];
  CHECK(prim.mesh == MeshIndex{0});
  CHECK(prim.vertexRange.start == 0);
  CHECK(prim.vertexRange.count() == 3);
  REQUIRE(prim.indexRange.has_value());
  CHECK(prim.indexRange->count() == 3);
  CHECK(pack->primitiveVertices(prim).size() == 3);
  CHECK(pack->primitiveIndices(prim).size() == 3);
  CHECK(prim.instanceCount() == 1);
  CHECK_FALSE(prim.isAnimated());

  CHECK(pack->textureCount() == 0);
  CHECK(pack->texture(0) == nullptr);
  CHECK(pack->colorBindGroup(0) == nullptr);
  CHECK(pack->channels().empty());
  CHECK(pack->nodeLayout().nodeCount() == 1);
  CHECK_FALSE(pack->isTransparent());
  CHECK(pack->aabb().min == glm::vec3(0.0F));
  CHECK(pack->aabb().max == glm::vec3(1.0F, 1.0F, 0.0F));
}

TEST_CASE_FIXTURE(PackFixture, "Primitives from several meshes are packed back to back") {
  GlbBuilder builder;
  const auto accessors = tests::addTriangleAccessors(builder);
  const std::string prim = tests::trianglePrimitiveJson(accessors);
  builder.set("meshes",
              std::format(R"([{{"primitives":[{},{}]}},{{"primitives":[{}]}}])", prim, prim, prim));
  builder.set("nodes", R"([{"mesh":0},{"mesh":1,"translation":[0,0,4]}])");
  builder.set("scenes", R"([{"nodes":[0,1]}])");

  auto pack = load(builder);
  REQUIRE(pack.has_value());
  REQUIRE(pack->primitiveCount() == 3);
  CHECK(pack->vertices().size() == 9);
  CHECK(pack->indices().size() == 9);

  for (size_t i = 0; i < 3; ++i) {
    const auto &p = pack->primitives()[i];
    CHECK(p.id == i);
    CHECK(p.vertexRange.start == i * 3);
    CHECK(p.indexRange->start == i * 3);
    // Indices stay local to their primitive
    CHECK(pack->primitiveIndices(p)[2] == 2);
  }
  CHECK(pack->primitives()[2].mesh == MeshIndex{1});
  CHECK(pack->primitives()[2].instanceTransforms[0][3][2] == doctest::Approx(4.0F));
}

TEST_CASE_FIXTURE(PackFixture, "Base color textures are uploaded and bound") {
  auto pack = load(texturedDocument(tests::checkerPng(3)));
  REQUIRE(pack.has_value());
  REQUIRE(pack->textureCount() == 1);

  auto *texture = pack->texture(0);
  REQUIRE(texture != nullptr);
  CHECK(texture->format() == renderer::rhi::Format::R8G8B8A8_SRGB);
  CHECK(texture->extent().width == 2);

  const auto &material = pack->primitives()[0].material;
  CHECK(material.name == "painted");
  REQUIRE(material.baseColorTexture.has_value());
  CHECK(material.baseColorTexture->textureIndex == 0);

  auto *set = dynamic_cast<renderer::rhi::NullRHIDescriptorSet *>(pack->colorBindGroup(0));
  REQUIRE(set != nullptr);
  const auto *image = set->binding(renderer::RenderContext::kColorTextureBinding);
  const auto *sampler = set->binding(renderer::RenderContext::kColorSamplerBinding);
  REQUIRE(image != nullptr);
  REQUIRE(sampler != nullptr);
  CHECK(image->texture == texture);
  CHECK(sampler->sampler == &context.textureSampler());

  auto *null = dynamic_cast<renderer::rhi::NullRHIDevice *>(device.get());
  REQUIRE(null != nullptr);
  CHECK(null->texturesCreated() == 1);
}

TEST_CASE_FIXTURE(PackFixture, "Blended materials make the pack transparent") {
  auto pack = load(texturedDocument(tests::checkerPng(), "BLEND"));
  REQUIRE(pack.has_value());
  CHECK(pack->isTransparent());
  CHECK(pack->primitives()[0].material.blendMode() == renderer::scene::BlendMode::PremultipliedAlpha);

  SUBCASE("One blended primitive is enough") {
    GlbBuilder mixed;
    const auto accessors = tests::addTriangleAccessors(mixed);
    mixed.set("meshes", std::format(R"([{{"primitives":[{},{}]}}])",
                                    tests::trianglePrimitiveJson(accessors, R"(,"material":0)"),
                                    tests::trianglePrimitiveJson(accessors, R"(,"material":1)")));
    mixed.set("materials", R"([{"alphaMode":"OPAQUE"},{"alphaMode":"BLEND"}])");
    mixed.set("nodes", R"([{"mesh":0}])");

    auto mixedPack = load(mixed);
    REQUIRE(mixedPack.has_value());
    CHECK(mixedPack->primitives()[0].material.alphaMode == renderer::scene::AlphaMode::Opaque);
    CHECK(mixedPack->isTransparent());
  }

  auto masked = load(tests::triangleDocument(R"([{"alphaMode":"MASK","alphaCutoff":0.3}])"));
  REQUIRE(masked.has_value());
  CHECK_FALSE(masked->isTransparent());
  CHECK(masked->primitives()[0].material.alphaCutoff == doctest::Approx(0.3F));
}

TEST_CASE_FIXTURE(PackFixture, "Animated instances reference the pack's channels") {
  auto pack = load(tests::animatedDocument());
  REQUIRE(pack.has_value());
  REQUIRE(pack->channels().size() == 1);
  CHECK(pack->channels()[0].targetNode() == NodeIndex{1});

  const auto &prim = pack->primitives()[0];
  REQUIRE(prim.instanceCount() == 2);
  CHECK(prim.isAnimated());
  CHECK(prim.instanceAnimations[0].empty());
  CHECK(prim.instanceAnimations[1] == std::vector<uint32_t>{0});
}

TEST_CASE_FIXTURE(PackFixture, "Load failures are classified") {
  SUBCASE("Not a glTF document") {
    const std::array<std::byte, 8> junk{};
    auto pack = ModelAssetPack::fromBytes(context, dir / "junk.glb", junk);
    REQUIRE_FALSE(pack.has_value());
    CHECK(pack.error().kind == LoadErrorKind::InvalidGltf);
  }

  SUBCASE("Missing file") {
    auto pack = ModelAssetPack::fromPath(context, dir / "missing.glb");
    REQUIRE_FALSE(pack.has_value());
    CHECK(pack.error().kind == LoadErrorKind::InvalidPath);
  }

  SUBCASE("No scene") {
    GlbBuilder builder = tests::triangleDocument();
    builder.set("scenes", "[]");
    CHECK(failureOf(builder) == LoadErrorKind::NoScene);
  }

  SUBCASE("Broken hierarchy") {
    GlbBuilder builder = tests::triangleDocument();
    builder.set("nodes", R"([{"mesh":0,"children":[0]}])");
    CHECK(failureOf(builder) == LoadErrorKind::MalformedDocument);
  }

  SUBCASE("Texture without image") {
    GlbBuilder builder = tests::triangleDocument(
        R"([{"pbrMetallicRoughness":{"baseColorTexture":{"index":0}}}])");
    builder.set("textures", R"([{"source":2}])");
    CHECK(failureOf(builder) == LoadErrorKind::MalformedDocument);
  }

  SUBCASE("Greyscale image") {
    const std::array<uint8_t, 4> grey = {1, 2, 3, 4};
    CHECK(failureOf(texturedDocument(tests::encodePng(2, 2, 1, grey))) ==
          LoadErrorKind::UnsupportedPixelFormat);
  }

  SUBCASE("Cubic spline animation") {
    GlbBuilder builder = tests::triangleDocument();
    static constexpr std::array<float, 2> kTimes = {0.0F, 1.0F};
    static constexpr std::array<float, 18> kValues{};
    const uint32_t times = builder.addFloatAccessor(kTimes, "SCALAR", true);
    const uint32_t values = builder.addFloatAccessor(kValues, "VEC3");
    builder.set("animations",
                std::format(R"([{{"samplers":[{{"input":{},"output":{},"interpolation":"CUBICSPLINE"}}],)"
                            R"("channels":[{{"sampler":0,"target":{{"node":0,"path":"scale"}}}}]}}])",
                            times, values));
    CHECK(failureOf(builder) == LoadErrorKind::UnsupportedFeature);
  }

  SUBCASE("Morph target weights") {
    GlbBuilder builder = tests::triangleDocument();
    static constexpr std::array<float, 2> kTimes = {0.0F, 1.0F};
    const uint32_t times = builder.addFloatAccessor(kTimes, "SCALAR", true);
    const uint32_t weights = builder.addFloatAccessor(kTimes, "SCALAR");
    builder.set("animations",
                std::format(R"([{{"samplers":[{{"input":{},"output":{}}}],)"
                            R"("channels":[{{"sampler":0,"target":{{"node":0,"path":"weights"}}}}]}}])",
                            times, weights));
    CHECK(failureOf(builder) == LoadErrorKind::UnsupportedFeature);
  }
}

TEST_CASE_FIXTURE(PackFixture, "Packs load from disk") {
  const auto path = texturedDocument(tests::checkerPng()).writeTo(dir / "on_disk.glb");
  auto pack = ModelAssetPack::fromPath(context, path);
  REQUIRE(pack.has_value());
  CHECK(pack->name() == "on_disk.glb");
  CHECK(pack->textureCount() == 1);
}

TEST_CASE("Materials without an occlusion texture keep full occlusion strength") {
  const auto gltf = tests::triangleDocument(R"([{"name":"plain"}])").parse();
  auto material = renderer::scene::Material::fromGltf(gltf, 0);
  REQUIRE(material.has_value());
  CHECK(material->name == "plain");
  CHECK(material->occlusionStrength == doctest::Approx(1.0F));

  auto fallback = renderer::scene::Material::fromGltf(gltf, std::nullopt);
  REQUIRE(fallback.has_value());
  CHECK(fallback->occlusionStrength == doctest::Approx(1.0F));
}

namespace {
// Switches the working directory for the lifetime of the guard
struct WorkingDirectoryGuard {
  explicit WorkingDirectoryGuard(const std::filesystem::path &dir)
      : previous(std::filesystem::current_path()) {
    std::filesystem::current_path(dir);
  }
  ~WorkingDirectoryGuard() { std::filesystem::current_path(previous); }

  std::filesystem::path previous;
};

GlbBuilder externalImageDocument(const std::string &uri) {
  GlbBuilder builder =
      tests::triangleDocument(R"([{"pbrMetallicRoughness":{"baseColorTexture":{"index":0}}}])");
  builder.set("images", std::format(R"([{{"uri":"{}"}}])", uri));
  builder.set("textures", R"([{"source":0}])");
  return builder;
}
} // namespace

TEST_CASE_FIXTURE(PackFixture, "External images resolve next to the document") {
  const auto png = tests::checkerPng();
  {
    std::ofstream file(dir / "sibling.png", std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char *>(png.data()), static_cast<std::streamsize>(png.size()));
  }
  const auto bytes = externalImageDocument("sibling.png").build();

  SUBCASE("Path with a directory") {
    auto pack = ModelAssetPack::fromBytes(context, dir / "model.glb", bytes);
    REQUIRE(pack.has_value());
    CHECK(pack->textureCount() == 1);
  }

  SUBCASE("Bare filename uses the working directory") {
    const WorkingDirectoryGuard guard(dir);
    auto pack = ModelAssetPack::fromBytes(context, "model.glb", bytes);
    REQUIRE(pack.has_value());
    REQUIRE(pack->textureCount() == 1);
    CHECK(pack->texture(0)->extent().width == 2);
  }

  SUBCASE("Missing sibling image") {
    const WorkingDirectoryGuard guard(dir);
    auto pack = ModelAssetPack::fromBytes(context, "model.glb", externalImageDocument("absent.png").build());
    REQUIRE_FALSE(pack.has_value());
    CHECK(pack.error().kind == LoadErrorKind::InvalidPath);
  }
}
