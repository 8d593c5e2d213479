#pragma once

#include <phosg/Image.hh>
#include <vector>

#include "Cli.hh"
#include "Palette.hh"
#include "Rasterizer.hh"
#include "Sprite.hh"
#include "Tile.hh"

namespace WadGfx {

using namespace phosg;

// Scaled index and mask planes of a tile. Tiles are square-pixeled, so the
// anamorphic option has no effect.
RenderedGraphic rasterize_tile(const Tile& tile, const RenderOptions& opts);

// Scaled index and mask planes of a sprite. If opts specifies a canvas size or
// a position, the sprite is first placed on a canvas of that size (default:
// the sprite's size) with its hotspot at that position (default: the
// sprite's hotspot), clipping anything outside.
RenderedGraphic rasterize_sprite(const Sprite& sprite, const RenderOptions& opts);

ImageRGBA8888N render_tile(
    const Tile& tile,
    const std::vector<Color8>& palette,
    const std::vector<uint8_t>& colormap,
    const RenderOptions& opts);
ImageRGBA8888N render_sprite(
    const Sprite& sprite,
    const std::vector<Color8>& palette,
    const std::vector<uint8_t>& colormap,
    const RenderOptions& opts);

} // namespace WadGfx
