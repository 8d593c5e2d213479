#include "SpriteCanvas.hh"

#include <format>
#include <phosg/Strings.hh>

#include "Errors.hh"

using namespace std;
using namespace phosg;

namespace WadGfx {

vector<Range> find_spans(const vector<bool>& flags) {
  vector<Range> ret;
  size_t z = 0;
  while (z < flags.size()) {
    while (z < flags.size() && !flags[z]) {
      z++;
    }
    if (z == flags.size()) {
      break;
    }
    size_t start = z;
    while (z < flags.size() && flags[z]) {
      z++;
    }
    ret.emplace_back(start, z);
  }
  return ret;
}

SpriteCanvas::SpriteCanvas(uint16_t width, uint16_t height)
    : w(width),
      h(height),
      pixel_data(static_cast<size_t>(width) * height, 0),
      mask_data(static_cast<size_t>(width) * height, false) {}

void SpriteCanvas::draw_patch(int32_t pos_x, int32_t pos_y, const Sprite& sprite) {
  // Place the sprite's hotspot at the given position
  int64_t offset_x = static_cast<int64_t>(pos_x) - sprite.left();
  int64_t offset_y = static_cast<int64_t>(pos_y) - sprite.top();

  Range x_range = Range(0, sprite.width())
                      .offset(offset_x)
                      .intersect(Range(0, this->w));
  for (int64_t x = x_range.start; x < x_range.end; x++) {
    size_t column_base = static_cast<size_t>(x) * this->h;
    for (const auto& span : sprite.column(x - offset_x)) {
      int64_t y_offset = offset_y + span.top;
      Range y_range = Range(0, span.count)
                          .offset(y_offset)
                          .intersect(Range(0, this->h));
      for (int64_t y = y_range.start; y < y_range.end; y++) {
        this->pixel_data[column_base + y] = span.pixels[y - y_offset];
        this->mask_data[column_base + y] = true;
      }
    }
  }
}

string SpriteCanvas::make_sprite() const {
  vector<uint32_t> column_offsets;
  StringWriter posts_w;

  for (size_t x = 0; x < this->w; x++) {
    column_offsets.emplace_back(posts_w.size());

    size_t column_base = x * this->h;
    vector<bool> column_mask(
        this->mask_data.begin() + column_base,
        this->mask_data.begin() + column_base + this->h);
    for (const auto& span : find_spans(column_mask)) {
      size_t length = span.size();
      if (length > MAX_ENCODABLE_RUN_LENGTH) {
        throw unencodable_run(std::format(
            "run of {} pixels in column {} is longer than the maximum post length ({})",
            length, x, MAX_ENCODABLE_RUN_LENGTH));
      }
      if (span.start >= POST_TERMINATOR) {
        throw unencodable_run(std::format(
            "run in column {} starts at row {}, which cannot be encoded as a post start", x, span.start));
      }
      posts_w.put_u8(span.start);
      posts_w.put_u8(length);
      posts_w.put_u8(length); // Unused
      posts_w.write(&this->pixel_data[column_base + span.start], length);
      posts_w.put_u8(0); // Unused
    }
    posts_w.put_u8(POST_TERMINATOR);
  }

  StringWriter sprite_w;
  sprite_w.put_u16l(this->w);
  sprite_w.put_u16l(this->h);
  sprite_w.put_u16l(0); // left
  sprite_w.put_u16l(0); // top

  uint32_t posts_offset = SPRITE_HEADER_SIZE + SPRITE_DIRECTORY_ENTRY_SIZE * column_offsets.size();
  for (uint32_t column_offset : column_offsets) {
    sprite_w.put_u32l(posts_offset + column_offset);
  }
  sprite_w.write(posts_w.str());

  return std::move(sprite_w.str());
}

Grid<uint8_t> SpriteCanvas::pixels() const {
  Grid<uint8_t> ret(this->w, this->h);
  for (size_t x = 0; x < this->w; x++) {
    for (size_t y = 0; y < this->h; y++) {
      ret.at(x, y) = this->pixel_data[x * this->h + y];
    }
  }
  return ret;
}

Grid<bool> SpriteCanvas::mask() const {
  Grid<bool> ret(this->w, this->h);
  for (size_t x = 0; x < this->w; x++) {
    for (size_t y = 0; y < this->h; y++) {
      ret.at(x, y) = this->mask_data[x * this->h + y];
    }
  }
  return ret;
}

} // namespace WadGfx
