#pragma once

#include <stddef.h>
#include <stdint.h>

#include <phosg/Strings.hh>
#include <string>

#include "Grid.hh"

namespace WadGfx {

using namespace phosg;

constexpr size_t TILE_DIMENSION = 64;
constexpr size_t TILE_SIZE = TILE_DIMENSION * TILE_DIMENSION;

// A flat: a 64x64 grid of palette indices, stored column-major on disk. This
// is a view over the caller's bytes, which must outlive it.
class Tile {
public:
  Tile(const void* data, size_t size);
  Tile(const Tile&) = default;
  Tile& operator=(const Tile&) = default;
  ~Tile() = default;

  inline size_t width() const {
    return TILE_DIMENSION;
  }
  inline size_t height() const {
    return TILE_DIMENSION;
  }

  uint8_t pixel(size_t row, size_t col) const;

  // Returns the whole tile as a row-major grid
  Grid<uint8_t> as_grid() const;

private:
  StringReader r;
};

Tile decode_tile(const void* data, size_t size);
// The returned Tile refers to data, so it can't be a temporary
Tile decode_tile(const std::string& data);
Tile decode_tile(std::string&& data) = delete;

} // namespace WadGfx
