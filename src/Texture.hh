#pragma once

#include <stddef.h>
#include <stdint.h>

#include <optional>
#include <string>
#include <vector>

#include "PatchProvider.hh"

namespace WadGfx {

constexpr size_t TEXTURE_HEADER_SIZE = 22;
constexpr size_t PATCH_RECORD_SIZE = 10;

// One patch placement within a texture. step_dir and colormap are unused by
// the engine and must be 1 and 0 respectively.
struct PatchRecord {
  int16_t origin_x;
  int16_t origin_y;
  uint16_t patch_id;
  uint16_t step_dir;
  uint16_t colormap;
};

// A texture definition: a name, dimensions and a list of patches to composite
// in order. This is a view over the caller's bytes.
class Texture {
public:
  Texture(const void* data, size_t size);
  Texture(const Texture&) = default;
  Texture& operator=(const Texture&) = default;
  ~Texture() = default;

  inline const std::string& name() const {
    return this->texture_name;
  }
  inline uint16_t width() const {
    return this->w;
  }
  inline uint16_t height() const {
    return this->h;
  }
  inline size_t num_patches() const {
    return this->patch_count;
  }

  // Throws unsupported_field if the record's step direction or colormap is
  // not the fixed value this format requires
  PatchRecord patch(size_t index) const;

private:
  const uint8_t* data;
  size_t size;
  std::string texture_name;
  uint16_t w;
  uint16_t h;
  uint16_t patch_count;
};

// A TEXTURE1 or TEXTURE2 lump
class TextureDirectory {
public:
  TextureDirectory(const void* data, size_t size);
  // The directory refers to data, so it can't be a temporary
  explicit TextureDirectory(const std::string& data);
  explicit TextureDirectory(std::string&& data) = delete;
  TextureDirectory(const TextureDirectory&) = default;
  TextureDirectory& operator=(const TextureDirectory&) = default;
  ~TextureDirectory() = default;

  inline size_t size() const {
    return this->offsets.size();
  }

  Texture texture(size_t index) const;

  // Returns the first texture with the given name (case-insensitive)
  std::optional<Texture> find(const std::string& name) const;

private:
  const uint8_t* data;
  size_t data_size;
  std::vector<uint32_t> offsets;
};

// Returns the raw 8-byte name fields of a PNAMES lump, in order
std::vector<std::string> parse_pnames(const std::string& data);

// One line describing the texture's header: name, width, height and number of
// patches, e.g. "BIGDOOR1 128 96 4"
std::string texture_summary(const Texture& texture);

// Describes the texture in DeuTex's texture definition format:
//   ; TextureName Width Height
//   NAME 64 128
//   ; PatchName Xoffset Yoffset
//   * PATCH 0 0
std::string texture_definition(const Texture& texture, const std::vector<std::string>& pnames);

// Composites all of the texture's patches onto a canvas of the texture's size
// and returns the result in the sprite format. Throws unresolved_patch if the
// provider cannot supply any of the patches.
std::string render_texture(const Texture& texture, const PatchProvider& patch_provider);

} // namespace WadGfx
