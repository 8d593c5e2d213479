#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "Fixtures.hh"
#include "Render.hh"
#include "SpriteCanvas.hh"

using namespace std;
using namespace WadGfx;

static vector<Color8> test_palette() {
  vector<Color8> ret;
  for (size_t i = 0; i < 256; i++) {
    ret.emplace_back(i, 0, 0);
  }
  return ret;
}

static vector<uint8_t> identity_colormap() {
  vector<uint8_t> ret;
  for (size_t i = 0; i < 256; i++) {
    ret.emplace_back(i);
  }
  return ret;
}

TEST(RenderTest, DefaultSpritePlacement) {
  string data = sample_sprite_data();
  Sprite sprite = decode_sprite(data);
  RenderOptions opts;

  auto planes = rasterize_sprite(sprite, opts);
  auto painted = paint(SpriteGraphic(sprite), 2);
  EXPECT_EQ(painted.pixels, planes.pixels);
  EXPECT_EQ(painted.mask, planes.mask);

  // Giving the sprite's own size and hotspot explicitly changes nothing
  opts.canvas_size = IntPair{SAMPLE_SPRITE_WIDTH, SAMPLE_SPRITE_HEIGHT};
  opts.position = IntPair{SAMPLE_SPRITE_LEFT, SAMPLE_SPRITE_TOP};
  auto explicit_planes = rasterize_sprite(sprite, opts);
  EXPECT_EQ(painted.pixels, explicit_planes.pixels);
  EXPECT_EQ(painted.mask, explicit_planes.mask);
}

TEST(RenderTest, SpriteOnLargerCanvas) {
  string data = sample_sprite_data();
  Sprite sprite = decode_sprite(data);
  RenderOptions opts;
  opts.scale = 1;
  opts.anamorphic = true;
  opts.canvas_size = IntPair{100, 80};
  opts.position = IntPair{50, 70};

  auto planes = rasterize_sprite(sprite, opts);
  ASSERT_EQ(100, planes.pixels.width());
  ASSERT_EQ(80, planes.pixels.height());

  SpriteCanvas canvas(100, 80);
  canvas.draw_patch(50, 70, sprite);
  EXPECT_EQ(canvas.pixels(), planes.pixels);
  EXPECT_EQ(canvas.mask(), planes.mask);

  // Column 1 of the sprite has one post at row 0, which lands at
  // (50 - 20 + 1, 70 - 50)
  EXPECT_EQ(sample_sprite_pixel(1, 0, 0), planes.pixels.at(31, 20));
}

TEST(RenderTest, PositionOnlyUsesSpriteSizedCanvas) {
  string data = sample_sprite_data();
  Sprite sprite = decode_sprite(data);
  RenderOptions opts;
  opts.scale = 3;
  opts.position = IntPair{0, 0};

  auto planes = rasterize_sprite(sprite, opts);
  EXPECT_EQ(SAMPLE_SPRITE_WIDTH * 3, planes.pixels.width());
  // trunc(57 * 18 / 5)
  EXPECT_EQ(205, planes.pixels.height());
}

TEST(RenderTest, RenderTile) {
  string data = sample_tile_data();
  Tile tile = decode_tile(data);
  RenderOptions opts;
  opts.scale = 1;
  auto img = render_tile(tile, test_palette(), identity_colormap(), opts);
  ASSERT_EQ(64, img.get_width());
  ASSERT_EQ(64, img.get_height());
  // (x = 5, y = 3) has index 11
  EXPECT_EQ(0x0B0000FFu, img.read(5, 3));
}

TEST(RenderTest, RenderSpriteMask) {
  string data = sample_sprite_data();
  Sprite sprite = decode_sprite(data);
  RenderOptions opts;
  opts.scale = 1;
  opts.anamorphic = true;
  opts.format = OutputFormat::MASK;
  auto img = render_sprite(sprite, test_palette(), identity_colormap(), opts);
  ASSERT_EQ(41, img.get_width());
  ASSERT_EQ(57, img.get_height());
  EXPECT_EQ(0x000000FFu, img.read(0, 0));
  EXPECT_EQ(0xFFFFFFFFu, img.read(1, 0));
}

TEST(RenderTest, PositionOutOfRange) {
  string data = sample_sprite_data();
  Sprite sprite = decode_sprite(data);
  RenderOptions opts;
  opts.canvas_size = IntPair{4, 4};
  opts.position = IntPair{4294967298LL, 0};
  EXPECT_THROW(rasterize_sprite(sprite, opts), invalid_argument);
}
