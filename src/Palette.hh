#pragma once

#include <stddef.h>
#include <stdint.h>

#include <optional>
#include <phosg/Image.hh>
#include <string>
#include <vector>

#include "Grid.hh"

namespace WadGfx {

using namespace phosg;

constexpr size_t PALETTE_BANK_SIZE = 256 * 3;
constexpr size_t COLORMAP_BANK_SIZE = 256;

struct Color8 {
  uint8_t r;
  uint8_t g;
  uint8_t b;

  Color8() = default;
  Color8(uint8_t r, uint8_t g, uint8_t b) : r(r), g(g), b(b) {}

  constexpr uint32_t rgba8888(uint8_t alpha = 0xFF) const {
    return phosg::rgba8888(this->r, this->g, this->b, alpha);
  }
};

// PLAYPAL holds several 256-color palettes back to back; COLORMAP holds
// several 256-entry index remapping tables back to back
size_t num_palette_banks(const std::string& playpal);
size_t num_colormap_banks(const std::string& colormap);
std::vector<Color8> palette_bank(const std::string& playpal, size_t index);
std::vector<uint8_t> colormap_bank(const std::string& colormap, size_t index);

enum class OutputFormat {
  // Palette colors, transparent where nothing was drawn (unless a background
  // index is given)
  FULL = 0,
  // Palette colors, fully opaque; a background index is required
  INDEXED,
  // White where something was drawn, black elsewhere
  MASK,
};

// Accepts full/f, indexed/i and mask/m
OutputFormat output_format_for_name(const std::string& name);

ImageRGBA8888N render_rgba(
    const Grid<uint8_t>& pixels,
    const Grid<bool>& mask,
    const std::vector<Color8>& palette,
    const std::vector<uint8_t>& colormap,
    OutputFormat format,
    std::optional<uint8_t> background = std::nullopt);

} // namespace WadGfx
