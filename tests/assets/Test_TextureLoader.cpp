#include "support/TestDocuments.hpp"

#include "kiln/assets/TextureLoader.hpp"
#include "kiln/rhi/rhi_factory.hpp"
#include "kiln/rhi/rhi_types.hpp"
#include "rhi/null/null_resources.hpp"
#include <algorithm>
#include <array>
#include <cpptrace/cpptrace.hpp>
#include <doctest/doctest.h>
#include <fastgltf/types.hpp>

using namespace kiln;
using assets::LoadErrorKind;

namespace {
uint8_t at(const std::vector<std::byte> &pixels, size_t i) {
  return static_cast<uint8_t>(pixels[i]);
}
} // namespace

TEST_CASE("RGB texels gain an opaque alpha channel") {
  const std::array<std::byte, 6> rgb = {std::byte{10}, std::byte{20}, std::byte{30},
                                        std::byte{40}, std::byte{50}, std::byte{60}};
  const auto rgba = assets::expandToRgba(rgb, 2, 1);
  REQUIRE(rgba.size() == 8);
  CHECK(at(rgba, 0) == 10);
  CHECK(at(rgba, 3) == 255);
  CHECK(at(rgba, 6) == 60);
  CHECK(at(rgba, 7) == 255);

  CHECK_THROWS_AS(assets::expandToRgba(rgb, 2, 2), cpptrace::logic_error);
}

TEST_CASE("Image decoding") {
  SUBCASE("RGBA passes through") {
    const auto png = tests::checkerPng(4);
    auto image = assets::decodeImage(png, "rgba");
    REQUIRE(image.has_value());
    CHECK(image->width == 2);
    CHECK(image->height == 2);
    REQUIRE(image->pixels.size() == 16);
    CHECK(at(image->pixels, 0) == 255);
    CHECK(at(image->pixels, 5) == 255);
    CHECK(at(image->pixels, 10) == 255);
  }

  SUBCASE("RGB is expanded") {
    const auto png = tests::checkerPng(3);
    auto image = assets::decodeImage(png, "rgb");
    REQUIRE(image.has_value());
    REQUIRE(image->pixels.size() == 16);
    CHECK(at(image->pixels, 4) == 0);
    CHECK(at(image->pixels, 5) == 255);
    CHECK(at(image->pixels, 7) == 255);
  }

  SUBCASE("Greyscale is unsupported") {
    const std::array<uint8_t, 4> grey = {0, 64, 128, 255};
    const auto png = tests::encodePng(2, 2, 1, grey);
    auto image = assets::decodeImage(png, "grey");
    REQUIRE_FALSE(image.has_value());
    CHECK(image.error().kind == LoadErrorKind::UnsupportedPixelFormat);
  }

  SUBCASE("16-bit channels are unsupported") {
    const std::vector<uint8_t> wide(2 * 2 * 4 * 2, 0x7F);
    const auto png = tests::encodePng(2, 2, 4, wide, 16);
    auto image = assets::decodeImage(png, "wide");
    REQUIRE_FALSE(image.has_value());
    CHECK(image.error().kind == LoadErrorKind::UnsupportedPixelFormat);
  }

  SUBCASE("Garbage is unsupported") {
    const std::array<std::byte, 5> junk = {std::byte{1}, std::byte{2}, std::byte{3},
                                           std::byte{4}, std::byte{5}};
    auto image = assets::decodeImage(junk, "junk");
    REQUIRE_FALSE(image.has_value());
    CHECK(image.error().kind == LoadErrorKind::UnsupportedPixelFormat);
  }
}

TEST_CASE("Image bytes come from buffer views or sibling files") {
  SUBCASE("Buffer view") {
    tests::GlbBuilder builder = tests::triangleDocument();
    const auto png = tests::checkerPng();
    builder.addImage(png);
    const auto gltf = builder.parse();
    REQUIRE(gltf.images.size() == 1);

    auto bytes = assets::imageBytes(gltf, gltf.images[0], {});
    REQUIRE(bytes.has_value());
    CHECK(*bytes == png);
  }

  SUBCASE("Missing sibling file") {
    tests::GlbBuilder builder = tests::triangleDocument();
    auto gltf = builder.parse();
    fastgltf::Image image;
    image.name = "lost";
    fastgltf::sources::URI source{};
    source.uri = fastgltf::URI(std::string_view("lost.png"));
    source.mimeType = fastgltf::MimeType::PNG;
    image.data = std::move(source);
    const auto dir = tests::scratchDirectory("image_bytes");
    auto bytes = assets::imageBytes(gltf, image, dir);
    REQUIRE_FALSE(bytes.has_value());
    CHECK(bytes.error().kind == LoadErrorKind::InvalidPath);
  }
}

TEST_CASE("Uploaded textures are sRGB RGBA8") {
  auto device = renderer::rhi::RHIFactory::createDevice(renderer::rhi::RHIBackend::Null);
  auto image = assets::decodeImage(tests::checkerPng(), "checker");
  REQUIRE(image.has_value());

  auto texture = assets::uploadTexture(*device, *image, "checker");
  REQUIRE(texture != nullptr);
  CHECK(texture->format() == renderer::rhi::Format::R8G8B8A8_SRGB);
  CHECK(texture->extent().width == 2);
  CHECK(texture->extent().height == 2);

  auto *null = dynamic_cast<renderer::rhi::NullRHITexture *>(texture.get());
  REQUIRE(null != nullptr);
  CHECK(std::ranges::equal(null->texels(), image->pixels));
}
