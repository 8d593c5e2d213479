#include "Palette.hh"

#include <format>
#include <phosg/Strings.hh>
#include <stdexcept>

using namespace std;
using namespace phosg;

namespace WadGfx {

size_t num_palette_banks(const string& playpal) {
  return playpal.size() / PALETTE_BANK_SIZE;
}

size_t num_colormap_banks(const string& colormap) {
  return colormap.size() / COLORMAP_BANK_SIZE;
}

vector<Color8> palette_bank(const string& playpal, size_t index) {
  size_t num_banks = num_palette_banks(playpal);
  if (index >= num_banks) {
    throw out_of_range(std::format("palette {} does not exist (there are {})", index, num_banks));
  }
  StringReader r(playpal.data() + index * PALETTE_BANK_SIZE, PALETTE_BANK_SIZE);
  vector<Color8> ret;
  while (!r.eof()) {
    uint8_t red = r.get_u8();
    uint8_t green = r.get_u8();
    uint8_t blue = r.get_u8();
    ret.emplace_back(red, green, blue);
  }
  return ret;
}

vector<uint8_t> colormap_bank(const string& colormap, size_t index) {
  size_t num_banks = num_colormap_banks(colormap);
  if (index >= num_banks) {
    throw out_of_range(std::format("colormap {} does not exist (there are {})", index, num_banks));
  }
  const uint8_t* bank = reinterpret_cast<const uint8_t*>(colormap.data()) + index * COLORMAP_BANK_SIZE;
  return vector<uint8_t>(bank, bank + COLORMAP_BANK_SIZE);
}

OutputFormat output_format_for_name(const string& name) {
  if (name == "full" || name == "f") {
    return OutputFormat::FULL;
  } else if (name == "indexed" || name == "i") {
    return OutputFormat::INDEXED;
  } else if (name == "mask" || name == "m") {
    return OutputFormat::MASK;
  }
  throw invalid_argument("format must be full/f, indexed/i, or mask/m");
}

ImageRGBA8888N render_rgba(
    const Grid<uint8_t>& pixels,
    const Grid<bool>& mask,
    const vector<Color8>& palette,
    const vector<uint8_t>& colormap,
    OutputFormat format,
    optional<uint8_t> background) {
  if (pixels.width() != mask.width() || pixels.height() != mask.height()) {
    throw invalid_argument("pixel and mask planes have different dimensions");
  }
  if (palette.size() != 256 || colormap.size() != COLORMAP_BANK_SIZE) {
    throw invalid_argument("palette and colormap must each have 256 entries");
  }
  if (format == OutputFormat::INDEXED && !background.has_value()) {
    throw invalid_argument("a background color index must be given for the indexed format");
  }

  auto color_for_index = [&](uint8_t index) -> uint32_t {
    return palette[colormap[index]].rgba8888();
  };

  uint32_t background_color = 0x00000000;
  if (format == OutputFormat::MASK) {
    background_color = 0x000000FF;
  } else if (background.has_value()) {
    background_color = color_for_index(*background);
  }

  ImageRGBA8888N ret(pixels.width(), pixels.height());
  for (size_t y = 0; y < pixels.height(); y++) {
    for (size_t x = 0; x < pixels.width(); x++) {
      if (!mask.at(x, y)) {
        ret.write(x, y, background_color);
      } else if (format == OutputFormat::MASK) {
        ret.write(x, y, 0xFFFFFFFF);
      } else {
        ret.write(x, y, color_for_index(pixels.at(x, y)));
      }
    }
  }
  return ret;
}

} // namespace WadGfx
