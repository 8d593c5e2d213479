#pragma once

#include <stdint.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Sprite.hh"
#include "WadFile.hh"

namespace WadGfx {

// Supplies decoded patches by PNAMES index. The texture assembler only talks
// to this interface.
class PatchProvider {
public:
  virtual ~PatchProvider() = default;

  // Returns the decoded patch, or std::nullopt if patch_id is out of range or
  // its lump is missing. Throws malformed_asset if the lump exists but cannot
  // be decoded; all implementations report this the same way.
  virtual std::optional<Sprite> get_patch(uint16_t patch_id) const = 0;

  // Returns the name of the patch (for messages), or an empty string if
  // patch_id is out of range
  virtual std::string name_for_patch(uint16_t patch_id) const = 0;

protected:
  PatchProvider() = default;
};

// Looks up and decodes the patch's lump on every call
class LazyPatchProvider : public PatchProvider {
public:
  LazyPatchProvider(std::shared_ptr<const WadFile> wad, const std::vector<std::string>& pnames);
  virtual ~LazyPatchProvider() = default;

  virtual std::optional<Sprite> get_patch(uint16_t patch_id) const;
  virtual std::string name_for_patch(uint16_t patch_id) const;

private:
  std::shared_ptr<const WadFile> wad;
  std::vector<std::string> pnames;
};

// Looks up and decodes every patch named in PNAMES once, at construction time.
// Missing lumps are remembered as absent; decoding errors are logged and
// rethrown when the patch is requested.
class EagerPatchProvider : public PatchProvider {
public:
  EagerPatchProvider(std::shared_ptr<const WadFile> wad, const std::vector<std::string>& pnames);
  virtual ~EagerPatchProvider() = default;

  virtual std::optional<Sprite> get_patch(uint16_t patch_id) const;
  virtual std::string name_for_patch(uint16_t patch_id) const;

  inline size_t num_resolved() const {
    return this->num_resolved_patches;
  }

private:
  std::shared_ptr<const WadFile> wad;
  std::vector<std::string> pnames;
  std::vector<std::optional<Sprite>> patches;
  std::vector<std::string> decode_errors;
  size_t num_resolved_patches;
};

} // namespace WadGfx
