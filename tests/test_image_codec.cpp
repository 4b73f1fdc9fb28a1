#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include <gdk/gdk.h>

#include "kovak/ImageCodec.hpp"

using namespace kovak;

namespace {

// 2x1 image: red, blue
GdkTexture* makeRgbTexture() {
    static const guint8 pixels[] = {0xff, 0x00, 0x00, 0x00, 0x00, 0xff};
    g_autoptr(GBytes) bytes = g_bytes_new_static(pixels, sizeof(pixels));
    return gdk_memory_texture_new(2, 1, GDK_MEMORY_R8G8B8, bytes, 6);
}

// Same pixels, opaque BGRA layout
GdkTexture* makeBgraTexture() {
    static const guint8 pixels[] = {0x00, 0x00, 0xff, 0xff, 0xff, 0x00, 0x00, 0xff};
    g_autoptr(GBytes) bytes = g_bytes_new_static(pixels, sizeof(pixels));
    return gdk_memory_texture_new(2, 1, GDK_MEMORY_B8G8R8A8, bytes, 8);
}

} // namespace

TEST(ImageHashTest, StableAndContentSensitive) {
    std::vector<std::uint8_t> a = {1, 2, 3, 4};
    std::vector<std::uint8_t> b = {1, 2, 3, 5};

    EXPECT_EQ(imageHash(a), imageHash(a));
    EXPECT_NE(imageHash(a), imageHash(b));
    EXPECT_EQ(imageHash(a).size(), 32u);
    EXPECT_EQ(imageHash({}), "d41d8cd98f00b204e9800998ecf8427e");
}

TEST(ImageHashTest, LabelEmbedsHash) {
    std::vector<std::uint8_t> png = {9, 9, 9};
    EXPECT_EQ(imageLabel(png), "Image which has no path (hash: " + imageHash(png) + ")");
}

TEST(ImageCodecTest, EncodesAsPng) {
    g_autoptr(GdkTexture) texture = makeRgbTexture();
    std::vector<std::uint8_t> png = encodeNormalizedPng(texture);

    ASSERT_GT(png.size(), 8u);
    const std::uint8_t signature[] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};
    EXPECT_TRUE(std::equal(std::begin(signature), std::end(signature), png.begin()));
}

TEST(ImageCodecTest, SamePixelsInDifferentLayoutsGetSameLabel) {
    g_autoptr(GdkTexture) rgb = makeRgbTexture();
    g_autoptr(GdkTexture) bgra = makeBgraTexture();

    ImageEntry a = makeImageEntry(rgb);
    ImageEntry b = makeImageEntry(bgra);
    EXPECT_EQ(a.label, b.label);
    EXPECT_EQ(a, b);
}

TEST(ImageCodecTest, DecodeRestoresDimensions) {
    g_autoptr(GdkTexture) texture = makeRgbTexture();
    std::vector<std::uint8_t> png = encodeNormalizedPng(texture);

    g_autoptr(GdkTexture) decoded = decodePng(png);
    ASSERT_NE(decoded, nullptr);
    EXPECT_EQ(gdk_texture_get_width(decoded), 2);
    EXPECT_EQ(gdk_texture_get_height(decoded), 1);
}

TEST(ImageCodecTest, BadInputGivesNothing) {
    EXPECT_TRUE(encodeNormalizedPng(nullptr).empty());
    EXPECT_EQ(decodePng({}), nullptr);
    EXPECT_EQ(decodePng({1, 2, 3}), nullptr);
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
