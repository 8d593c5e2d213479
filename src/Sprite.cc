#include "Sprite.hh"

#include <format>
#include <phosg/Strings.hh>
#include <stdexcept>

#include "Errors.hh"

using namespace std;
using namespace phosg;

namespace WadGfx {

Column::Iterator::Iterator()
    : data(nullptr),
      size(0),
      offset(0),
      column_index(0),
      done(true),
      current{0, nullptr, 0} {}

Column::Iterator::Iterator(const uint8_t* data, size_t size, size_t offset, size_t column_index)
    : data(data),
      size(size),
      offset(offset),
      column_index(column_index),
      done(false),
      current{0, nullptr, 0} {
  this->read_post();
}

void Column::Iterator::read_post() {
  // Post layout: top, count, unused, pixels[count], unused. A top of 0xFF ends
  // the column.
  if (this->offset >= this->size) {
    throw malformed_asset(std::format(
        "column {} runs past the end of the sprite data at offset {}", this->column_index, this->offset));
  }
  uint8_t top = this->data[this->offset];
  if (top == POST_TERMINATOR) {
    this->done = true;
    return;
  }
  if (this->offset + 3 > this->size) {
    throw malformed_asset(std::format(
        "post header in column {} at offset {} is truncated", this->column_index, this->offset));
  }
  size_t count = this->data[this->offset + 1];
  size_t post_end = this->offset + 4 + count;
  if (post_end > this->size) {
    throw malformed_asset(std::format(
        "post in column {} at offset {} declares {} pixels, which extends past the end of the sprite data",
        this->column_index, this->offset, count));
  }
  this->current.top = top;
  this->current.pixels = this->data + this->offset + 3;
  this->current.count = count;
  this->offset = post_end;
}

Column::Iterator& Column::Iterator::operator++() {
  if (!this->done) {
    this->read_post();
  }
  return *this;
}

bool Column::Iterator::operator==(const Iterator& other) const {
  if (this->done || other.done) {
    return this->done == other.done;
  }
  return (this->data == other.data) && (this->offset == other.offset);
}

bool Column::Iterator::operator!=(const Iterator& other) const {
  return !(*this == other);
}

Column::Column(const uint8_t* data, size_t size, size_t offset, size_t column_index)
    : data(data),
      size(size),
      offset(offset),
      column_index(column_index) {}

Column::Iterator Column::begin() const {
  return Iterator(this->data, this->size, this->offset, this->column_index);
}

Column::Iterator Column::end() const {
  return Iterator();
}

size_t Column::num_posts() const {
  size_t ret = 0;
  for (auto it = this->begin(); it != this->end(); ++it) {
    ret++;
  }
  return ret;
}

Sprite::Sprite(const void* data, size_t size)
    : data(reinterpret_cast<const uint8_t*>(data)),
      data_size(size) {
  if (size < SPRITE_HEADER_SIZE) {
    throw malformed_asset(std::format("sprite is too small for its header ({} bytes)", size));
  }

  StringReader r(data, size);
  this->w = r.get_u16l();
  this->h = r.get_u16l();
  this->left_offset = r.get_s16l();
  this->top_offset = r.get_s16l();

  size_t posts_offset = SPRITE_HEADER_SIZE + this->w * SPRITE_DIRECTORY_ENTRY_SIZE;
  if (size < posts_offset) {
    throw malformed_asset(std::format(
        "sprite is too small for its column directory ({} columns need {} bytes; have {})",
        this->w, posts_offset, size));
  }

  // Every column must start inside the post data region. The posts themselves
  // are checked as they are read.
  for (size_t x = 0; x < this->w; x++) {
    uint32_t column_offset = r.get_u32l();
    if (column_offset < posts_offset || column_offset >= size) {
      throw malformed_asset(std::format(
          "column {} has offset {}, outside the post data region [{}, {})",
          x, column_offset, posts_offset, size));
    }
  }
}

Column Sprite::column(size_t index) const {
  if (index >= this->w) {
    throw out_of_range(std::format("column {} out of range for sprite of width {}", index, this->w));
  }
  StringReader r(this->data, this->data_size);
  size_t column_offset = r.pget_u32l(SPRITE_HEADER_SIZE + index * SPRITE_DIRECTORY_ENTRY_SIZE);
  return Column(this->data, this->data_size, column_offset, index);
}

size_t Sprite::num_posts() const {
  size_t ret = 0;
  for (size_t x = 0; x < this->w; x++) {
    ret += this->column(x).num_posts();
  }
  return ret;
}

Sprite decode_sprite(const void* data, size_t size) {
  return Sprite(data, size);
}

Sprite decode_sprite(const string& data) {
  return Sprite(data.data(), data.size());
}

} // namespace WadGfx
