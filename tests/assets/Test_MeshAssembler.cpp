#include "support/TestDocuments.hpp"

#include "kiln/assets/MeshAssembler.hpp"
#include "kiln/core/Settings.hpp"
#include <array>
#include <doctest/doctest.h>
#include <format>

using namespace kiln;
using namespace kiln::renderer;
using assets::AssemblyContext;
using assets::LoadErrorKind;
using assets::MeshAssembler;
using kiln::tests::GlbBuilder;

namespace {
assets::LoadResult<scene::Mesh> assemble(const GlbBuilder &builder, uint32_t mesh = 0) {
  const auto gltf = builder.parse();
  auto layout = scene::NodeLayout::fromDocument(gltf);
  REQUIRE(layout.has_value());
  AssemblyContext context;
  return MeshAssembler::parse(*layout, {}, gltf, MeshIndex{mesh}, context);
}

GlbBuilder singlePrimitive(const std::string &primitiveJson) {
  GlbBuilder builder;
  builder.set("meshes", std::format(R"([{{"primitives":[{}]}}])", primitiveJson));
  builder.set("nodes", R"([{"mesh":0}])");
  return builder;
}

constexpr std::array<float, 9> kPositions = {0, 0, 0, 1, 0, 0, 0, 1, 0};
} // namespace

TEST_CASE("Indexed triangle with normals and UVs") {
  auto mesh = assemble(kiln::tests::triangleDocument());
  REQUIRE(mesh.has_value());
  CHECK(mesh->index == MeshIndex{0});
  CHECK(mesh->name == "triangle");
  REQUIRE(mesh->primitives.size() == 1);

  const scene::Primitive &prim = mesh->primitives[0];
  CHECK(prim.id == 0);
  REQUIRE(prim.vertices.size() == 3);
  REQUIRE(prim.indices.has_value());
  CHECK(*prim.indices == std::vector<uint32_t>{0, 1, 2});

  const uint32_t mask = prim.vertices[0].m_featureMask;
  CHECK(mask == (VertexFeature::Position | VertexFeature::Normal | VertexFeature::TexCoord0));
  for (const auto &v : prim.vertices) {
    CHECK(v.m_featureMask == mask);
    CHECK(v.m_normal == glm::vec3(0, 0, 1));
  }
  CHECK(prim.vertices[1].m_position == glm::vec3(1, 0, 0));
  CHECK(prim.vertices[2].m_texCoord0 == glm::vec2(0, 1));

  SUBCASE("Generated tangents follow +U") {
    const glm::vec4 t = prim.vertices[0].m_tangent;
    CHECK(t.x == doctest::Approx(1.0F));
    CHECK(t.y == doctest::Approx(0.0F).epsilon(0.001));
    CHECK(t.z == doctest::Approx(0.0F).epsilon(0.001));
    CHECK(t.w == doctest::Approx(1.0F));
    CHECK_FALSE(VertexFeature::hasTangent(mask));
  }

  SUBCASE("Bounds come from the POSITION accessor") {
    CHECK(prim.aabb.min == glm::vec3(0, 0, 0));
    CHECK(prim.aabb.max == glm::vec3(1, 1, 0));
    CHECK(mesh->aabb.max == glm::vec3(1, 1, 0));
  }

  SUBCASE("One instance at the node transform") {
    CHECK(prim.instanceCount() == 1);
    CHECK(prim.instanceNodes[0] == NodeIndex{0});
    CHECK(prim.instanceTransforms[0] == glm::mat4(1.0F));
    CHECK_FALSE(prim.isAnimated());
  }
}

TEST_CASE("Tangent generation can be switched off") {
  core::settings::generateTangents.set(false);
  auto mesh = assemble(kiln::tests::triangleDocument());
  core::settings::generateTangents.reset();

  REQUIRE(mesh.has_value());
  CHECK(mesh->primitives[0].vertices[0].m_tangent == glm::vec4(1.0F));
}

TEST_CASE("Tangents need a UV set") {
  SUBCASE("Normals without UVs keep the default tangent") {
    GlbBuilder builder;
    const auto accessors = kiln::tests::addTriangleAccessors(builder);
    builder.set("meshes", std::format(
        R"([{{"primitives":[{{"attributes":{{"POSITION":{},"NORMAL":{}}},"indices":{}}}]}}])",
        accessors.positions, accessors.normals, accessors.indices));
    builder.set("nodes", R"([{"mesh":0}])");

    auto mesh = assemble(builder);
    REQUIRE(mesh.has_value());
    const auto &vertices = mesh->primitives[0].vertices;
    CHECK(vertices[0].m_featureMask == (VertexFeature::Position | VertexFeature::Normal));
    for (const auto &v : vertices) {
      CHECK(v.m_tangent == glm::vec4(1.0F));
    }
  }

  SUBCASE("TEXCOORD_1 alone drives generation") {
    GlbBuilder builder;
    const auto accessors = kiln::tests::addTriangleAccessors(builder);
    builder.set("meshes", std::format(
        R"([{{"primitives":[{{"attributes":{{"POSITION":{},"NORMAL":{},"TEXCOORD_1":{}}},"indices":{}}}]}}])",
        accessors.positions, accessors.normals, accessors.texCoords, accessors.indices));
    builder.set("nodes", R"([{"mesh":0}])");

    auto mesh = assemble(builder);
    REQUIRE(mesh.has_value());
    const auto &vertices = mesh->primitives[0].vertices;
    CHECK(VertexFeature::hasTexCoord1(vertices[0].m_featureMask));
    CHECK_FALSE(VertexFeature::hasTexCoord0(vertices[0].m_featureMask));
    for (const auto &v : vertices) {
      CHECK(v.m_tangent.x == doctest::Approx(1.0F));
      CHECK(v.m_tangent.y == doctest::Approx(0.0F).epsilon(0.001));
      CHECK(v.m_tangent.z == doctest::Approx(0.0F).epsilon(0.001));
      CHECK(v.m_tangent.w == doctest::Approx(1.0F));
    }
  }
}

TEST_CASE("Missing streams keep their defaults") {
  GlbBuilder builder;
  const uint32_t positions = builder.addFloatAccessor(kPositions, "VEC3");
  builder.set("meshes", std::format(R"([{{"primitives":[{{"attributes":{{"POSITION":{}}}}}]}}])",
                                    positions));
  builder.set("nodes", R"([{"mesh":0}])");

  auto mesh = assemble(builder);
  REQUIRE(mesh.has_value());
  const scene::Primitive &prim = mesh->primitives[0];

  CHECK(prim.vertices[0].m_featureMask == VertexFeature::Position);
  CHECK(prim.vertices[0].m_normal == glm::vec3(1.0F));
  CHECK(prim.vertices[0].m_tangent == glm::vec4(1.0F));
  CHECK(prim.vertices[0].m_color == glm::vec4(1.0F));
  CHECK_FALSE(prim.indices.has_value());

  // No min/max on the accessor: bounds are computed from the points
  CHECK(prim.aabb.min == glm::vec3(0, 0, 0));
  CHECK(prim.aabb.max == glm::vec3(1, 1, 0));
}

TEST_CASE("Vertex colors") {
  SUBCASE("Tinted material forces the color stream") {
    auto mesh = assemble(kiln::tests::triangleDocument(
        R"([{"pbrMetallicRoughness":{"baseColorFactor":[1,0,0,1]}}])"));
    REQUIRE(mesh.has_value());
    const auto &v = mesh->primitives[0].vertices[0];
    CHECK(VertexFeature::hasColor(v.m_featureMask));
    CHECK(v.m_color == glm::vec4(1, 0, 0, 1));
  }

  SUBCASE("COLOR_0 vec3 gets opaque alpha") {
    GlbBuilder builder;
    const uint32_t positions = builder.addFloatAccessor(kPositions, "VEC3");
    static constexpr std::array<float, 9> kColors = {0, 1, 0, 0, 1, 0, 0, 0, 1};
    const uint32_t colors = builder.addFloatAccessor(kColors, "VEC3");
    builder.set("meshes",
                std::format(R"([{{"primitives":[{{"attributes":{{"POSITION":{},"COLOR_0":{}}}}}]}}])",
                            positions, colors));
    builder.set("nodes", R"([{"mesh":0}])");

    auto mesh = assemble(builder);
    REQUIRE(mesh.has_value());
    const auto &vertices = mesh->primitives[0].vertices;
    CHECK(VertexFeature::hasColor(vertices[0].m_featureMask));
    CHECK(vertices[0].m_color == glm::vec4(0, 1, 0, 1));
    CHECK(vertices[2].m_color == glm::vec4(0, 0, 1, 1));
  }
}

TEST_CASE("Index widths widen to 32 bits") {
  GlbBuilder builder;
  const uint32_t positions = builder.addFloatAccessor(kPositions, "VEC3");
  static constexpr std::array<uint8_t, 3> kIndices = {2, 1, 0};
  const uint32_t indices = builder.addIndexAccessor(std::span<const uint8_t>(kIndices));
  builder.set("meshes", std::format(R"([{{"primitives":[{{"attributes":{{"POSITION":{}}},"indices":{}}}]}}])",
                                    positions, indices));
  builder.set("nodes", R"([{"mesh":0}])");

  auto mesh = assemble(builder);
  REQUIRE(mesh.has_value());
  CHECK(*mesh->primitives[0].indices == std::vector<uint32_t>{2, 1, 0});
}

TEST_CASE("Malformed primitives") {
  SUBCASE("Index past the vertex count") {
    GlbBuilder builder;
    const uint32_t positions = builder.addFloatAccessor(kPositions, "VEC3");
    static constexpr std::array<uint32_t, 3> kIndices = {0, 1, 3};
    const uint32_t indices = builder.addIndexAccessor(std::span<const uint32_t>(kIndices));
    builder.set("meshes",
                std::format(R"([{{"primitives":[{{"attributes":{{"POSITION":{}}},"indices":{}}}]}}])",
                            positions, indices));
    builder.set("nodes", R"([{"mesh":0}])");

    auto mesh = assemble(builder);
    REQUIRE_FALSE(mesh.has_value());
    CHECK(mesh.error().kind == LoadErrorKind::MalformedDocument);
  }

  SUBCASE("Attribute count differs from POSITION") {
    GlbBuilder builder;
    const uint32_t positions = builder.addFloatAccessor(kPositions, "VEC3");
    static constexpr std::array<float, 4> kTexCoords = {0, 0, 1, 1};
    const uint32_t uvs = builder.addFloatAccessor(kTexCoords, "VEC2");
    builder.set("meshes",
                std::format(R"([{{"primitives":[{{"attributes":{{"POSITION":{},"TEXCOORD_0":{}}}}}]}}])",
                            positions, uvs));
    builder.set("nodes", R"([{"mesh":0}])");

    auto mesh = assemble(builder);
    REQUIRE_FALSE(mesh.has_value());
    CHECK(mesh.error().kind == LoadErrorKind::MalformedDocument);
  }

  SUBCASE("No POSITION stream") {
    GlbBuilder builder;
    static constexpr std::array<float, 9> kNormals = {0, 0, 1, 0, 0, 1, 0, 0, 1};
    const uint32_t normals = builder.addFloatAccessor(kNormals, "VEC3");
    builder.set("meshes",
                std::format(R"([{{"primitives":[{{"attributes":{{"NORMAL":{}}}}}]}}])", normals));
    builder.set("nodes", R"([{"mesh":0}])");

    auto mesh = assemble(builder);
    REQUIRE_FALSE(mesh.has_value());
    CHECK(mesh.error().kind == LoadErrorKind::MalformedDocument);
  }

  SUBCASE("Mesh index out of range") {
    auto mesh = assemble(kiln::tests::triangleDocument(), 3);
    REQUIRE_FALSE(mesh.has_value());
    CHECK(mesh.error().kind == LoadErrorKind::MalformedDocument);
  }
}

TEST_CASE("Meshes without instances produce no primitives") {
  GlbBuilder builder;
  const auto accessors = kiln::tests::addTriangleAccessors(builder);
  builder.set("meshes", std::format(R"([{{"primitives":[{}]}},{{"primitives":[{}]}}])",
                                    kiln::tests::trianglePrimitiveJson(accessors),
                                    kiln::tests::trianglePrimitiveJson(accessors)));
  builder.set("nodes", R"([{"mesh":0}])");

  auto unused = assemble(builder, 1);
  REQUIRE(unused.has_value());
  CHECK(unused->primitives.empty());
  CHECK(unused->aabb.isEmpty());
}

TEST_CASE("Primitive ids are unique within one load") {
  GlbBuilder builder;
  const auto accessors = kiln::tests::addTriangleAccessors(builder);
  builder.set("meshes", std::format(R"([{{"primitives":[{},{}]}},{{"primitives":[{}]}}])",
                                    kiln::tests::trianglePrimitiveJson(accessors),
                                    kiln::tests::trianglePrimitiveJson(accessors),
                                    kiln::tests::trianglePrimitiveJson(accessors)));
  builder.set("nodes", R"([{"mesh":0},{"mesh":1}])");
  builder.set("scenes", R"([{"nodes":[0,1]}])");

  const auto gltf = builder.parse();
  auto layout = scene::NodeLayout::fromDocument(gltf);
  REQUIRE(layout.has_value());
  const scene::InstanceBatcher batcher(*layout, {});

  AssemblyContext context;
  auto first = MeshAssembler::parse(batcher, gltf, MeshIndex{0}, context);
  auto second = MeshAssembler::parse(batcher, gltf, MeshIndex{1}, context);
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());
  CHECK(first->primitives[0].id == 0);
  CHECK(first->primitives[1].id == 1);
  CHECK(second->primitives[0].id == 2);
}

TEST_CASE("Feature masks describe their streams") {
  CHECK(VertexFeature::describe(VertexFeature::None) == "NONE");
  CHECK(VertexFeature::describe(VertexFeature::Position | VertexFeature::Normal |
                                VertexFeature::TexCoord0) == "POSITION | NORMAL | TEX_COORD_0");
  CHECK(VertexFeature::hasAnyTexCoord(VertexFeature::TexCoord1));
  CHECK_FALSE(VertexFeature::hasAnyTexCoord(VertexFeature::Color));
}
