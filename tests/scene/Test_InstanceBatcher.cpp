#include "support/TestDocuments.hpp"

#include "kiln/renderer/scene/InstanceBatcher.hpp"
#include <cpptrace/cpptrace.hpp>
#include <doctest/doctest.h>

using namespace kiln::renderer::scene;

TEST_CASE("Every node referencing a mesh becomes one instance") {
  const auto gltf = kiln::tests::animatedDocument().parse();
  auto layout = NodeLayout::fromDocument(gltf);
  REQUIRE(layout.has_value());
  auto channels = parseAnimations(gltf);
  REQUIRE(channels.has_value());
  REQUIRE(channels->size() == 1);

  const InstanceBatcher batcher(*layout, *channels);
  const InstanceBatch batch = batcher.batch(MeshIndex{0});

  REQUIRE(batch.size() == 2);
  CHECK(batch.nodes[0] == NodeIndex{0});
  CHECK(batch.nodes[1] == NodeIndex{1});
  CHECK(batch.transforms[0][3][0] == doctest::Approx(-5.0F));
  CHECK(batch.transforms[1] == glm::mat4(1.0F));

  CHECK(batch.animations[0].empty());
  REQUIRE(batch.animations[1].size() == 1);
  CHECK(batch.animations[1][0] == 0);

  CHECK(batcher.channelsFor(NodeIndex{1}).size() == 1);
  CHECK(batcher.channelsFor(NodeIndex{42}).empty());
  CHECK(batcher.batch(MeshIndex{3}).empty());
}

TEST_CASE("Channels outside the layout are a programming error") {
  const auto gltf = kiln::tests::triangleDocument().parse();
  auto layout = NodeLayout::fromDocument(gltf);
  REQUIRE(layout.has_value());

  auto stray = AnimationChannel::create(NodeIndex{5}, AnimationProperty::Translation,
                                        AnimationInterpolation::Linear, {0.0F}, {0, 0, 0});
  REQUIRE(stray.has_value());
  std::vector<AnimationChannel> channels{*stray};

  CHECK_THROWS_AS(InstanceBatcher(*layout, channels), cpptrace::logic_error);
}
