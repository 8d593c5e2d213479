#include "Texture.hh"

#include <format>
#include <phosg/Strings.hh>
#include <stdexcept>

#include "Errors.hh"
#include "SpriteCanvas.hh"

using namespace std;
using namespace phosg;

namespace WadGfx {

Texture::Texture(const void* data, size_t size)
    : data(reinterpret_cast<const uint8_t*>(data)),
      size(size) {
  // Header: name[8], masked (u32, unused), width, height, column directory
  // (u32, obsolete), patch count; then the patch records
  if (size < TEXTURE_HEADER_SIZE) {
    throw malformed_asset(std::format("texture record is too small ({} bytes)", size));
  }
  StringReader r(data, size);
  this->texture_name = lump_name_from_bytes(this->data, LUMP_NAME_LENGTH);
  r.skip(LUMP_NAME_LENGTH + 4);
  this->w = r.get_u16l();
  this->h = r.get_u16l();
  r.skip(4);
  this->patch_count = r.get_u16l();

  size_t end_offset = TEXTURE_HEADER_SIZE + this->patch_count * PATCH_RECORD_SIZE;
  if (end_offset > size) {
    throw malformed_asset(std::format(
        "texture {} declares {} patches, but the record is only {} bytes",
        this->texture_name, this->patch_count, size));
  }
}

PatchRecord Texture::patch(size_t index) const {
  if (index >= this->patch_count) {
    throw out_of_range(std::format(
        "patch {} out of range for texture {} with {} patches", index, this->texture_name, this->patch_count));
  }
  StringReader r(this->data, this->size);
  r.go(TEXTURE_HEADER_SIZE + index * PATCH_RECORD_SIZE);

  PatchRecord ret;
  ret.origin_x = r.get_s16l();
  ret.origin_y = r.get_s16l();
  ret.patch_id = r.get_u16l();
  ret.step_dir = r.get_u16l();
  ret.colormap = r.get_u16l();
  if (ret.step_dir != 1) {
    throw unsupported_field(std::format(
        "patch {} of texture {} has step direction {} (expected 1)", index, this->texture_name, ret.step_dir));
  }
  if (ret.colormap != 0) {
    throw unsupported_field(std::format(
        "patch {} of texture {} has colormap {} (expected 0)", index, this->texture_name, ret.colormap));
  }
  return ret;
}

TextureDirectory::TextureDirectory(const void* data, size_t size)
    : data(reinterpret_cast<const uint8_t*>(data)),
      data_size(size) {
  if (size < 4) {
    throw malformed_asset("texture directory is too small for its count field");
  }
  StringReader r(data, size);
  uint32_t count = r.get_u32l();
  if (count & 0x80000000) {
    throw malformed_asset(std::format("texture directory has invalid count {:08X}", count));
  }
  size_t offsets_end = 4 + static_cast<size_t>(count) * 4;
  if (offsets_end > size) {
    throw malformed_asset(std::format(
        "texture directory declares {} textures, but is only {} bytes", count, size));
  }
  while (this->offsets.size() < count) {
    uint32_t offset = r.get_u32l();
    if (offset < offsets_end || offset >= size) {
      throw malformed_asset(std::format(
          "texture {} has offset {}, outside the record region [{}, {})",
          this->offsets.size(), offset, offsets_end, size));
    }
    this->offsets.emplace_back(offset);
  }
}

TextureDirectory::TextureDirectory(const string& data)
    : TextureDirectory(data.data(), data.size()) {}

Texture TextureDirectory::texture(size_t index) const {
  uint32_t offset = this->offsets.at(index);
  return Texture(this->data + offset, this->data_size - offset);
}

optional<Texture> TextureDirectory::find(const string& name) const {
  string key = lump_name_from_bytes(name.data(), name.size());
  for (size_t z = 0; z < this->offsets.size(); z++) {
    Texture t = this->texture(z);
    if (t.name() == key) {
      return t;
    }
  }
  return nullopt;
}

vector<string> parse_pnames(const string& data) {
  if (data.size() < 4) {
    throw malformed_asset("PNAMES is too small for its count field");
  }
  StringReader r(data);
  uint32_t count = r.get_u32l();
  if (static_cast<uint64_t>(count) * LUMP_NAME_LENGTH > r.remaining()) {
    throw malformed_asset(std::format(
        "PNAMES declares {} names, but has room for only {}", count, r.remaining() / LUMP_NAME_LENGTH));
  }
  vector<string> ret;
  while (ret.size() < count) {
    ret.emplace_back(r.read(LUMP_NAME_LENGTH));
  }
  return ret;
}

string texture_summary(const Texture& texture) {
  return std::format("{} {} {} {}", texture.name(), texture.width(), texture.height(), texture.num_patches());
}

string texture_definition(const Texture& texture, const vector<string>& pnames) {
  string ret = "; TextureName Width Height\n";
  ret += std::format("{} {} {}\n", texture.name(), texture.width(), texture.height());
  ret += "; PatchName Xoffset Yoffset\n";
  for (size_t z = 0; z < texture.num_patches(); z++) {
    PatchRecord record = texture.patch(z);
    if (record.patch_id >= pnames.size()) {
      throw unresolved_patch(std::format(
          "texture {} uses patch {}, but PNAMES has only {} entries", texture.name(), record.patch_id, pnames.size()));
    }
    const auto& raw_name = pnames[record.patch_id];
    ret += std::format("* {} {} {}\n",
        lump_name_from_bytes(raw_name.data(), raw_name.size()), record.origin_x, record.origin_y);
  }
  return ret;
}

string render_texture(const Texture& texture, const PatchProvider& patch_provider) {
  SpriteCanvas canvas(texture.width(), texture.height());

  for (size_t z = 0; z < texture.num_patches(); z++) {
    PatchRecord record = texture.patch(z);
    auto patch = patch_provider.get_patch(record.patch_id);
    if (!patch.has_value()) {
      string patch_name = patch_provider.name_for_patch(record.patch_id);
      throw unresolved_patch(std::format(
          "texture {} uses patch {} ({}), which cannot be resolved",
          texture.name(), record.patch_id, patch_name.empty() ? "not in PNAMES" : patch_name));
    }
    log_debug_f("Texture {}: patch {} ({}) at ({}, {})",
        texture.name(), z, patch_provider.name_for_patch(record.patch_id), record.origin_x, record.origin_y);

    // The record's origin is the position of the patch's top-left corner, so
    // add the patch's hotspot back in since draw_patch subtracts it
    canvas.draw_patch(
        static_cast<int32_t>(record.origin_x) + patch->left(),
        static_cast<int32_t>(record.origin_y) + patch->top(),
        *patch);
  }

  return canvas.make_sprite();
}

} // namespace WadGfx
