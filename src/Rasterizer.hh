#pragma once

#include <stddef.h>
#include <stdint.h>

#include <format>
#include <stdexcept>

#include "Grid.hh"
#include "Rational.hh"
#include "Sprite.hh"
#include "Tile.hh"

namespace WadGfx {

// The assets were drawn for a 320x200 display shown at 4:3, so each source
// pixel is 6/5 as tall as it is wide.
extern const Rational DESIGN_PIXEL_ASPECT_RATIO;

// Nearest-neighbor resize. The output has input.width() * horizontal_factor
// columns and trunc(input.height() * vertical_factor) rows; each output pixel
// is copied from the source pixel found by exact division of its coordinates
// by the factors.
template <typename T>
Grid<T> scale(const Grid<T>& input, uint32_t horizontal_factor, const Rational& vertical_factor) {
  if (horizontal_factor == 0) {
    throw std::invalid_argument("horizontal scale factor must be positive");
  }
  if (vertical_factor <= Rational(0)) {
    throw std::invalid_argument(std::format("vertical scale factor ({}) must be positive", vertical_factor.str()));
  }

  size_t out_width = input.width() * horizontal_factor;
  size_t out_height = (Rational(input.height()) * vertical_factor).to_integer();
  Grid<T> ret(out_width, out_height);
  for (size_t y = 0; y < out_height; y++) {
    size_t src_y = (Rational(y) / vertical_factor).to_integer();
    for (size_t x = 0; x < out_width; x++) {
      ret.at(x, y) = input.at(x / horizontal_factor, src_y);
    }
  }
  return ret;
}

// Something that can be rendered one source column at a time: a tile or a
// sprite. pixels and mask are row-major targets of equal size.
class Graphic {
public:
  virtual ~Graphic() = default;

  virtual size_t width() const = 0;
  virtual size_t height() const = 0;
  virtual Rational pixel_aspect_ratio() const = 0;

  // Renders source column source_x into column target_x of the targets,
  // stretched vertically by vertical_scale. Only the rows covered by the
  // graphic are written; their mask bits are set.
  virtual void draw_column(
      size_t source_x,
      size_t target_x,
      Grid<uint8_t>& pixels,
      Grid<bool>& mask,
      const Rational& vertical_scale) const = 0;

protected:
  Graphic() = default;
};

class TileGraphic : public Graphic {
public:
  explicit TileGraphic(const Tile& tile);
  virtual ~TileGraphic() = default;

  virtual size_t width() const;
  virtual size_t height() const;
  virtual Rational pixel_aspect_ratio() const;
  virtual void draw_column(
      size_t source_x,
      size_t target_x,
      Grid<uint8_t>& pixels,
      Grid<bool>& mask,
      const Rational& vertical_scale) const;

private:
  Tile tile;
};

class SpriteGraphic : public Graphic {
public:
  explicit SpriteGraphic(const Sprite& sprite);
  virtual ~SpriteGraphic() = default;

  virtual size_t width() const;
  virtual size_t height() const;
  virtual Rational pixel_aspect_ratio() const;
  virtual void draw_column(
      size_t source_x,
      size_t target_x,
      Grid<uint8_t>& pixels,
      Grid<bool>& mask,
      const Rational& vertical_scale) const;

private:
  Sprite sprite;
};

struct RenderedGraphic {
  Grid<uint8_t> pixels;
  Grid<bool> mask;
};

// Renders the whole graphic scaled by scale horizontally and by scale times
// its pixel aspect ratio vertically. If correct_aspect is false, the aspect
// ratio is ignored (the output has the same non-square pixels as the source).
RenderedGraphic paint(const Graphic& graphic, uint32_t scale, bool correct_aspect = true);

} // namespace WadGfx
