#include "Render.hh"

#include <format>
#include <stdexcept>

#include "SpriteCanvas.hh"

using namespace std;
using namespace phosg;

namespace WadGfx {

static Rational vertical_scale_for_options(const Rational& pixel_aspect_ratio, const RenderOptions& opts) {
  Rational ret(opts.scale);
  return opts.anamorphic ? ret : ret * pixel_aspect_ratio;
}

RenderedGraphic rasterize_tile(const Tile& tile, const RenderOptions& opts) {
  return paint(TileGraphic(tile), opts.scale, !opts.anamorphic);
}

RenderedGraphic rasterize_sprite(const Sprite& sprite, const RenderOptions& opts) {
  if (!opts.canvas_size.has_value() && !opts.position.has_value()) {
    return paint(SpriteGraphic(sprite), opts.scale, !opts.anamorphic);
  }

  if (opts.position.has_value() && !opts.position->fits_int32()) {
    throw invalid_argument(std::format("position ({}, {}) is out of range", opts.position->x, opts.position->y));
  }
  uint16_t width = opts.canvas_size.has_value() ? opts.canvas_size->x : sprite.width();
  uint16_t height = opts.canvas_size.has_value() ? opts.canvas_size->y : sprite.height();
  int32_t pos_x = opts.position.has_value() ? opts.position->x : sprite.left();
  int32_t pos_y = opts.position.has_value() ? opts.position->y : sprite.top();

  SpriteCanvas canvas(width, height);
  canvas.draw_patch(pos_x, pos_y, sprite);

  Rational vertical_scale = vertical_scale_for_options(DESIGN_PIXEL_ASPECT_RATIO, opts);
  return RenderedGraphic{
      scale(canvas.pixels(), opts.scale, vertical_scale),
      scale(canvas.mask(), opts.scale, vertical_scale)};
}

ImageRGBA8888N render_tile(
    const Tile& tile,
    const vector<Color8>& palette,
    const vector<uint8_t>& colormap,
    const RenderOptions& opts) {
  auto planes = rasterize_tile(tile, opts);
  return render_rgba(planes.pixels, planes.mask, palette, colormap, opts.format, opts.background);
}

ImageRGBA8888N render_sprite(
    const Sprite& sprite,
    const vector<Color8>& palette,
    const vector<uint8_t>& colormap,
    const RenderOptions& opts) {
  auto planes = rasterize_sprite(sprite, opts);
  return render_rgba(planes.pixels, planes.mask, palette, colormap, opts.format, opts.background);
}

} // namespace WadGfx
