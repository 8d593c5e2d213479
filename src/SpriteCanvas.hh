#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "Grid.hh"
#include "Range.hh"
#include "Sprite.hh"

namespace WadGfx {

constexpr size_t MAX_ENCODABLE_RUN_LENGTH = 0xFF;

// Returns the maximal runs of true values in flags, in order
std::vector<Range> find_spans(const std::vector<bool>& flags);

// A pixel plane plus a mask plane that sprites can be stamped onto. Both
// planes are stored column-major, like the sprite format itself.
class SpriteCanvas {
public:
  SpriteCanvas(uint16_t width, uint16_t height);
  SpriteCanvas(const SpriteCanvas&) = default;
  SpriteCanvas(SpriteCanvas&&) = default;
  SpriteCanvas& operator=(const SpriteCanvas&) = default;
  SpriteCanvas& operator=(SpriteCanvas&&) = default;
  ~SpriteCanvas() = default;

  inline uint16_t width() const {
    return this->w;
  }
  inline uint16_t height() const {
    return this->h;
  }

  // Draws sprite so that its hotspot lands on (pos_x, pos_y). Anything that
  // falls outside the canvas is clipped.
  void draw_patch(int32_t pos_x, int32_t pos_y, const Sprite& sprite);

  // Encodes the canvas in the sprite format. Transparent pixels become gaps
  // between posts. The hotspot of the result is always (0, 0), since the
  // canvas contents are already positioned. Throws unencodable_run if a run
  // of opaque pixels cannot be represented as a post.
  std::string make_sprite() const;

  // Native planes; element (x, y) is at x * height + y
  inline const std::vector<uint8_t>& pixels_column_major() const {
    return this->pixel_data;
  }
  inline const std::vector<bool>& mask_column_major() const {
    return this->mask_data;
  }

  // Transposed (row-major) planes, for the rasterizer
  Grid<uint8_t> pixels() const;
  Grid<bool> mask() const;

private:
  uint16_t w;
  uint16_t h;
  std::vector<uint8_t> pixel_data;
  std::vector<bool> mask_data;
};

} // namespace WadGfx
