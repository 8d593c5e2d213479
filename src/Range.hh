#pragma once

#include <stddef.h>
#include <stdint.h>

#include <algorithm>

namespace WadGfx {

// Half-open signed interval [start, end). Used for clipping placements that
// may begin or end outside a canvas; 64-bit so that any 32-bit position plus
// a 16-bit offset or extent cannot overflow.
struct Range {
  int64_t start;
  int64_t end;

  Range() : start(0), end(0) {}
  Range(int64_t start, int64_t end) : start(start), end(end) {}

  inline Range offset(int64_t delta) const {
    return Range(this->start + delta, this->end + delta);
  }

  inline Range intersect(const Range& other) const {
    return Range(std::max(this->start, other.start), std::min(this->end, other.end));
  }

  inline bool empty() const {
    return this->end <= this->start;
  }

  inline size_t size() const {
    return this->empty() ? 0 : static_cast<size_t>(this->end - this->start);
  }

  inline bool operator==(const Range& other) const {
    return (this->start == other.start) && (this->end == other.end);
  }
};

} // namespace WadGfx
