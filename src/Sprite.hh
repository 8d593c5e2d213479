#pragma once

#include <stddef.h>
#include <stdint.h>

#include <iterator>
#include <string>
#include <utility>

namespace WadGfx {

constexpr size_t SPRITE_HEADER_SIZE = 8;
constexpr size_t SPRITE_DIRECTORY_ENTRY_SIZE = 4;
constexpr uint8_t POST_TERMINATOR = 0xFF;

// One vertical run of opaque pixels in a sprite column. pixels points into
// the sprite's buffer.
struct Span {
  uint16_t top;
  const uint8_t* pixels;
  size_t count;
};

// The posts of one sprite column. Iterating reads the posts directly from the
// sprite's buffer; every iteration starts over from the first post.
class Column {
public:
  class Iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Span;
    using difference_type = ptrdiff_t;
    using pointer = const Span*;
    using reference = Span;

    Iterator();
    Iterator(const uint8_t* data, size_t size, size_t offset, size_t column_index);

    // Returns a copy, so the span stays valid after the iterator is gone. Its
    // pixels still point into the sprite's buffer.
    inline Span operator*() const {
      return this->current;
    }
    inline const Span* operator->() const {
      return &this->current;
    }
    Iterator& operator++();
    bool operator==(const Iterator& other) const;
    bool operator!=(const Iterator& other) const;

  private:
    const uint8_t* data;
    size_t size;
    size_t offset;
    size_t column_index;
    bool done;
    Span current;

    void read_post();
  };

  Column(const uint8_t* data, size_t size, size_t offset, size_t column_index);

  Iterator begin() const;
  Iterator end() const;

  // Walks the whole column; throws malformed_asset if it is not terminated
  // within the buffer
  size_t num_posts() const;

private:
  const uint8_t* data;
  size_t size;
  size_t offset;
  size_t column_index;
};

// A patch-format graphic: header, column directory and post data. This is a
// view over the caller's bytes, which must outlive it (and all Columns
// obtained from it).
class Sprite {
public:
  Sprite(const void* data, size_t size);
  Sprite(const Sprite&) = default;
  Sprite& operator=(const Sprite&) = default;
  ~Sprite() = default;

  inline uint16_t width() const {
    return this->w;
  }
  inline uint16_t height() const {
    return this->h;
  }
  inline std::pair<uint16_t, uint16_t> dimensions() const {
    return std::make_pair(this->w, this->h);
  }
  // Hotspot, relative to the sprite's top-left corner
  inline std::pair<int16_t, int16_t> origin() const {
    return std::make_pair(this->left_offset, this->top_offset);
  }
  inline int16_t left() const {
    return this->left_offset;
  }
  inline int16_t top() const {
    return this->top_offset;
  }
  // Size of the encoded sprite in bytes
  inline size_t size() const {
    return this->data_size;
  }

  Column column(size_t index) const;

  // Total number of posts in all columns
  size_t num_posts() const;

private:
  const uint8_t* data;
  size_t data_size;
  uint16_t w;
  uint16_t h;
  int16_t left_offset;
  int16_t top_offset;
};

Sprite decode_sprite(const void* data, size_t size);
// The returned Sprite refers to data, so it can't be a temporary
Sprite decode_sprite(const std::string& data);
Sprite decode_sprite(std::string&& data) = delete;

} // namespace WadGfx
