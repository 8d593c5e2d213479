#pragma once

#include <stddef.h>
#include <stdint.h>

#include <optional>
#include <phosg/Arguments.hh>
#include <string>

#include "Palette.hh"

namespace WadGfx {

struct IntPair {
  int64_t x;
  int64_t y;

  bool operator==(const IntPair& other) const {
    return (this->x == other.x) && (this->y == other.y);
  }
  // True if both components can be used as canvas positions
  bool fits_int32() const {
    return (this->x >= INT32_MIN) && (this->x <= INT32_MAX) &&
        (this->y >= INT32_MIN) && (this->y <= INT32_MAX);
  }
};

// Parses two integers separated by `x` or `,`, e.g. 320x200 or 100,-20. Exactly
// one separator is allowed.
IntPair parse_cli_pair(const std::string& str);

// Options shared by all commands that produce images
struct RenderOptions {
  size_t palette_index = 0;
  size_t colormap_index = 0;
  uint32_t scale = 2;
  // If true, output non-square pixels instead of correcting the aspect ratio
  bool anamorphic = false;
  OutputFormat format = OutputFormat::FULL;
  std::optional<uint8_t> background;
  // Sprites only: output canvas size and hotspot position. Default to the
  // sprite's dimensions and hotspot.
  std::optional<IntPair> canvas_size;
  std::optional<IntPair> position;
};

RenderOptions parse_render_options(phosg::Arguments& args);

} // namespace WadGfx
