#include "Fixtures.hh"

#include <phosg/Strings.hh>

using namespace std;
using namespace phosg;
using namespace WadGfx;

string encode_test_sprite(
    uint16_t width,
    uint16_t height,
    int16_t left,
    int16_t top,
    const vector<TestColumn>& columns) {
  StringWriter posts_w;
  vector<uint32_t> offsets;
  for (const auto& column : columns) {
    offsets.emplace_back(8 + 4 * width + posts_w.size());
    for (const auto& post : column) {
      posts_w.put_u8(post.top);
      posts_w.put_u8(post.pixels.size());
      posts_w.put_u8(0);
      posts_w.write(post.pixels.data(), post.pixels.size());
      posts_w.put_u8(0);
    }
    posts_w.put_u8(0xFF);
  }

  StringWriter w;
  w.put_u16l(width);
  w.put_u16l(height);
  w.put_u16l(left);
  w.put_u16l(top);
  for (uint32_t offset : offsets) {
    w.put_u32l(offset);
  }
  w.write(posts_w.str());
  return std::move(w.str());
}

uint8_t sample_sprite_pixel(size_t x, size_t post_index, size_t row_in_post) {
  return (x * 7 + post_index * 31 + row_in_post * 3 + 1) & 0xFF;
}

vector<TestColumn> sample_sprite_columns() {
  vector<TestColumn> ret;
  for (size_t x = 0; x < SAMPLE_SPRITE_WIDTH; x++) {
    auto& column = ret.emplace_back();
    for (size_t k = 0; k < x % 4; k++) {
      auto& post = column.emplace_back();
      post.top = 19 * k;
      for (size_t y = 0; y < 1 + (x % 5); y++) {
        post.pixels.emplace_back(sample_sprite_pixel(x, k, y));
      }
    }
  }
  return ret;
}

string sample_sprite_data() {
  return encode_test_sprite(
      SAMPLE_SPRITE_WIDTH, SAMPLE_SPRITE_HEIGHT, SAMPLE_SPRITE_LEFT, SAMPLE_SPRITE_TOP, sample_sprite_columns());
}

string sample_tile_data() {
  string ret(4096, '\0');
  for (size_t x = 0; x < 64; x++) {
    for (size_t y = 0; y < 64; y++) {
      ret[x * 64 + y] = static_cast<char>((x + 2 * y) & 0xFF);
    }
  }
  return ret;
}

string padded_name(const string& name) {
  string ret = name;
  ret.resize(8, '\0');
  return ret;
}

string encode_test_texture(
    const string& name,
    uint16_t width,
    uint16_t height,
    const vector<PatchRecord>& patches) {
  StringWriter w;
  w.write(padded_name(name));
  w.put_u32l(0);
  w.put_u16l(width);
  w.put_u16l(height);
  w.put_u32l(0);
  w.put_u16l(patches.size());
  for (const auto& patch : patches) {
    w.put_u16l(patch.origin_x);
    w.put_u16l(patch.origin_y);
    w.put_u16l(patch.patch_id);
    w.put_u16l(patch.step_dir);
    w.put_u16l(patch.colormap);
  }
  return std::move(w.str());
}

string encode_test_texture_directory(const vector<string>& records) {
  StringWriter w;
  w.put_u32l(records.size());
  uint32_t offset = 4 + 4 * records.size();
  for (const auto& record : records) {
    w.put_u32l(offset);
    offset += record.size();
  }
  for (const auto& record : records) {
    w.write(record);
  }
  return std::move(w.str());
}

string encode_test_pnames(const vector<string>& names) {
  StringWriter w;
  w.put_u32l(names.size());
  for (const auto& name : names) {
    w.write(padded_name(name));
  }
  return std::move(w.str());
}
