#include "PatchProvider.hh"

#include <phosg/Strings.hh>

#include "Errors.hh"

using namespace std;
using namespace phosg;

namespace WadGfx {

LazyPatchProvider::LazyPatchProvider(shared_ptr<const WadFile> wad, const vector<string>& pnames)
    : wad(wad) {
  for (const auto& name : pnames) {
    this->pnames.emplace_back(lump_name_from_bytes(name.data(), name.size()));
  }
}

optional<Sprite> LazyPatchProvider::get_patch(uint16_t patch_id) const {
  if (patch_id >= this->pnames.size()) {
    return nullopt;
  }
  auto lump = this->wad->find_lump(this->pnames[patch_id]);
  if (!lump) {
    return nullopt;
  }
  return decode_sprite(lump->data);
}

string LazyPatchProvider::name_for_patch(uint16_t patch_id) const {
  return (patch_id < this->pnames.size()) ? this->pnames[patch_id] : "";
}

EagerPatchProvider::EagerPatchProvider(shared_ptr<const WadFile> wad, const vector<string>& pnames)
    : wad(wad),
      num_resolved_patches(0) {
  for (const auto& raw_name : pnames) {
    const auto& name = this->pnames.emplace_back(lump_name_from_bytes(raw_name.data(), raw_name.size()));
    auto& patch = this->patches.emplace_back();
    auto& decode_error = this->decode_errors.emplace_back();

    auto lump = this->wad->find_lump(name);
    if (!lump) {
      log_warning_f("Patch {} ({}) is listed in PNAMES but not present", this->pnames.size() - 1, name);
      continue;
    }
    try {
      patch = decode_sprite(lump->data);
      this->num_resolved_patches++;
    } catch (const malformed_asset& e) {
      log_warning_f("Patch {} ({}) cannot be decoded: {}", this->pnames.size() - 1, name, e.what());
      decode_error = e.what();
    }
  }
}

optional<Sprite> EagerPatchProvider::get_patch(uint16_t patch_id) const {
  if (patch_id >= this->patches.size()) {
    return nullopt;
  }
  if (!this->decode_errors[patch_id].empty()) {
    throw malformed_asset(this->decode_errors[patch_id]);
  }
  return this->patches[patch_id];
}

string EagerPatchProvider::name_for_patch(uint16_t patch_id) const {
  return (patch_id < this->pnames.size()) ? this->pnames[patch_id] : "";
}

} // namespace WadGfx
