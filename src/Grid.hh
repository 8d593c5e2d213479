#pragma once

#include <stddef.h>

#include <algorithm>
#include <format>
#include <stdexcept>
#include <vector>

namespace WadGfx {

// Dense row-major 2D array. This is the interchange format between the
// decoders, the canvas and the rasterizer; element (x, y) is at index
// y * width + x.
template <typename T>
class Grid {
public:
  Grid() : w(0), h(0) {}
  Grid(size_t width, size_t height, const T& fill = T())
      : w(width),
        h(height),
        data(width * height, fill) {}
  Grid(size_t width, size_t height, std::vector<T>&& data)
      : w(width),
        h(height),
        data(std::move(data)) {
    if (this->data.size() != this->w * this->h) {
      throw std::invalid_argument(std::format(
          "grid data size ({}) does not match dimensions ({}x{})", this->data.size(), this->w, this->h));
    }
  }
  Grid(const Grid&) = default;
  Grid(Grid&&) = default;
  Grid& operator=(const Grid&) = default;
  Grid& operator=(Grid&&) = default;
  ~Grid() = default;

  inline size_t width() const {
    return this->w;
  }
  inline size_t height() const {
    return this->h;
  }

  inline typename std::vector<T>::reference at(size_t x, size_t y) {
    this->check(x, y);
    return this->data[y * this->w + x];
  }
  inline typename std::vector<T>::const_reference at(size_t x, size_t y) const {
    this->check(x, y);
    return this->data[y * this->w + x];
  }

  inline const std::vector<T>& values() const {
    return this->data;
  }

  void fill(const T& value) {
    std::fill(this->data.begin(), this->data.end(), value);
  }

  bool operator==(const Grid& other) const {
    return (this->w == other.w) && (this->h == other.h) && (this->data == other.data);
  }

private:
  size_t w;
  size_t h;
  std::vector<T> data;

  inline void check(size_t x, size_t y) const {
    if (x >= this->w || y >= this->h) {
      throw std::out_of_range(std::format("({}, {}) is outside {}x{} grid", x, y, this->w, this->h));
    }
  }
};

} // namespace WadGfx
