#include "Rasterizer.hh"

using namespace std;

namespace WadGfx {

const Rational DESIGN_PIXEL_ASPECT_RATIO = Rational(320, 200) / Rational(4, 3);

TileGraphic::TileGraphic(const Tile& tile) : tile(tile) {}

size_t TileGraphic::width() const {
  return this->tile.width();
}

size_t TileGraphic::height() const {
  return this->tile.height();
}

Rational TileGraphic::pixel_aspect_ratio() const {
  return Rational(1);
}

void TileGraphic::draw_column(
    size_t source_x,
    size_t target_x,
    Grid<uint8_t>& pixels,
    Grid<bool>& mask,
    const Rational& vertical_scale) const {
  for (size_t y = 0; y < pixels.height(); y++) {
    size_t src_y = (Rational(y) / vertical_scale).to_integer();
    if (src_y >= this->tile.height()) {
      break;
    }
    pixels.at(target_x, y) = this->tile.pixel(src_y, source_x);
    mask.at(target_x, y) = true;
  }
}

SpriteGraphic::SpriteGraphic(const Sprite& sprite) : sprite(sprite) {}

size_t SpriteGraphic::width() const {
  return this->sprite.width();
}

size_t SpriteGraphic::height() const {
  return this->sprite.height();
}

Rational SpriteGraphic::pixel_aspect_ratio() const {
  return DESIGN_PIXEL_ASPECT_RATIO;
}

void SpriteGraphic::draw_column(
    size_t source_x,
    size_t target_x,
    Grid<uint8_t>& pixels,
    Grid<bool>& mask,
    const Rational& vertical_scale) const {
  int64_t target_height = pixels.height();
  for (const auto& span : this->sprite.column(source_x)) {
    // Output row y shows source row trunc(y / scale), so the post covers the
    // rows from ceil(top * scale) up to (but not including)
    // ceil((top + count) * scale)
    int64_t start_y = (Rational(span.top) * vertical_scale).ceil();
    int64_t end_y = (Rational(span.top + span.count) * vertical_scale).ceil();
    end_y = min<int64_t>(end_y, target_height);
    for (int64_t y = start_y; y < end_y; y++) {
      size_t index = (Rational(y) / vertical_scale).to_integer() - span.top;
      pixels.at(target_x, y) = span.pixels[index];
      mask.at(target_x, y) = true;
    }
  }
}

RenderedGraphic paint(const Graphic& graphic, uint32_t scale, bool correct_aspect) {
  if (scale == 0) {
    throw invalid_argument("scale factor must be positive");
  }
  Rational vertical_scale = Rational(scale);
  if (correct_aspect) {
    vertical_scale = vertical_scale * graphic.pixel_aspect_ratio();
  }

  size_t out_width = graphic.width() * scale;
  size_t out_height = (Rational(graphic.height()) * vertical_scale).to_integer();
  RenderedGraphic ret{Grid<uint8_t>(out_width, out_height), Grid<bool>(out_width, out_height)};
  for (size_t x = 0; x < out_width; x++) {
    graphic.draw_column(x / scale, x, ret.pixels, ret.mask, vertical_scale);
  }
  return ret;
}

} // namespace WadGfx
