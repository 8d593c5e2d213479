#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "Texture.hh"

// Byte-level builders for synthetic assets. These are written independently
// of SpriteCanvas so that encoder and decoder tests don't share code.

struct TestPost {
  uint8_t top;
  std::vector<uint8_t> pixels;
};

using TestColumn = std::vector<TestPost>;

std::string encode_test_sprite(
    uint16_t width,
    uint16_t height,
    int16_t left,
    int16_t top,
    const std::vector<TestColumn>& columns);

// 41x57 sprite with hotspot (20, 50). Column x has x % 4 posts; post k starts
// at row 19 * k and is 1 + (x % 5) pixels long. 60 posts in total.
constexpr uint16_t SAMPLE_SPRITE_WIDTH = 41;
constexpr uint16_t SAMPLE_SPRITE_HEIGHT = 57;
constexpr int16_t SAMPLE_SPRITE_LEFT = 20;
constexpr int16_t SAMPLE_SPRITE_TOP = 50;
constexpr size_t SAMPLE_SPRITE_NUM_POSTS = 60;
std::vector<TestColumn> sample_sprite_columns();
uint8_t sample_sprite_pixel(size_t x, size_t post_index, size_t row_in_post);
std::string sample_sprite_data();

// A 64x64 flat where the byte for (row y, column x) is (x + 2 * y) & 0xFF
std::string sample_tile_data();

std::string encode_test_texture(
    const std::string& name,
    uint16_t width,
    uint16_t height,
    const std::vector<WadGfx::PatchRecord>& patches);
std::string encode_test_texture_directory(const std::vector<std::string>& records);
std::string encode_test_pnames(const std::vector<std::string>& names);

// Pads name with NULs to 8 bytes
std::string padded_name(const std::string& name);
