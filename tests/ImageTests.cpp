#include "image/Image.h"

#include <gtest/gtest.h>

using namespace Tessera;

static Image gradient(int w, int h) {
  Image img(w, h);
  for (int y = 0; y < h; ++y)
    for (int x = 0; x < w; ++x)
      img.setPixel(x, y, {(uint8_t)x, (uint8_t)y, 7, 255});
  return img;
}

TEST(Image, PixelAccessOutsideIsTransparent) {
  const Image img = gradient(4, 3);
  EXPECT_EQ(img.pixel(2, 1), (Rgba8{2, 1, 7, 255}));
  EXPECT_EQ(img.pixel(-1, 0), Rgba8{});
  EXPECT_EQ(img.pixel(4, 0), Rgba8{});
  EXPECT_TRUE(img.contains(3, 2));
  EXPECT_FALSE(img.contains(3, 3));
}

TEST(Image, CropPadsOutOfRangeArea) {
  const Image img = gradient(4, 4);
  const Image c = img.crop(-1, 2, 2, 6);
  ASSERT_EQ(c.width(), 3);
  ASSERT_EQ(c.height(), 4);
  EXPECT_EQ(c.pixel(0, 0), Rgba8{});
  EXPECT_EQ(c.pixel(1, 0), (Rgba8{0, 2, 7, 255}));
  EXPECT_EQ(c.pixel(2, 1), (Rgba8{1, 3, 7, 255}));
  EXPECT_EQ(c.pixel(1, 2), Rgba8{});
}

TEST(Image, SliceIconIncludesMargin) {
  const Image table = gradient(200, 200);
  const Image icon = sliceIcon(table, {10.0f, 20.0f});
  ASSERT_EQ(icon.width(), 50);
  ASSERT_EQ(icon.height(), 50);
  EXPECT_EQ(icon.pixel(0, 0), (Rgba8{9, 19, 7, 255}));
  EXPECT_EQ(icon.pixel(1, 1), (Rgba8{10, 20, 7, 255}));
  EXPECT_EQ(icon.pixel(49, 49), (Rgba8{58, 68, 7, 255}));
}

TEST(Image, SliceAtCanvasEdgeIsPadded) {
  const Image table = gradient(48, 48);
  const Image icon = sliceIcon(table, {0.0f, 0.0f});
  EXPECT_EQ(icon.pixel(0, 0), Rgba8{});
  EXPECT_EQ(icon.pixel(1, 1), (Rgba8{0, 0, 7, 255}));
  EXPECT_EQ(icon.pixel(49, 1), Rgba8{});
}

TEST(Image, HexColor) {
  EXPECT_EQ(formatHexColor(255, 0, 0), "#FF0000");
  EXPECT_EQ(formatHexColor(0x12, 0xAB, 0x0C), "#12AB0C");
  EXPECT_EQ(formatHexColor(0, 0, 0), "#000000");
}
