#include "Tile.hh"

#include <format>
#include <stdexcept>

#include "Errors.hh"

using namespace std;
using namespace phosg;

namespace WadGfx {

Tile::Tile(const void* data, size_t size) : r(data, size) {
  if (size != TILE_SIZE) {
    throw malformed_asset(std::format("tile must be exactly {} bytes (got {})", TILE_SIZE, size));
  }
}

uint8_t Tile::pixel(size_t row, size_t col) const {
  if (row >= TILE_DIMENSION || col >= TILE_DIMENSION) {
    throw out_of_range(std::format("tile pixel ({}, {}) out of range", row, col));
  }
  return this->r.pget_u8(col * TILE_DIMENSION + row);
}

Grid<uint8_t> Tile::as_grid() const {
  Grid<uint8_t> ret(TILE_DIMENSION, TILE_DIMENSION);
  for (size_t x = 0; x < TILE_DIMENSION; x++) {
    for (size_t y = 0; y < TILE_DIMENSION; y++) {
      ret.at(x, y) = this->r.pget_u8(x * TILE_DIMENSION + y);
    }
  }
  return ret;
}

Tile decode_tile(const void* data, size_t size) {
  return Tile(data, size);
}

Tile decode_tile(const string& data) {
  return Tile(data.data(), data.size());
}

} // namespace WadGfx
