#pragma once

#include <stddef.h>
#include <stdint.h>

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace WadGfx {

constexpr size_t LUMP_NAME_LENGTH = 8;

// Validates a lump name given by the user (1-8 characters) and returns it in
// the canonical upper-case form used for lookups
std::string normalize_lump_name(const std::string& name);

// Decodes a NUL-padded name field (as found in the WAD directory and in
// PNAMES) into its canonical upper-case form
std::string lump_name_from_bytes(const void* data, size_t size = LUMP_NAME_LENGTH);

class WadFile {
public:
  enum class Type {
    IWAD = 0,
    PWAD,
  };

  struct Lump {
    std::string name;
    std::string data;

    Lump(const std::string& name, std::string&& data);
  };

  explicit WadFile(Type type = Type::PWAD);
  WadFile(const WadFile&) = default;
  WadFile(WadFile&&) = default;
  WadFile& operator=(const WadFile&) = default;
  WadFile& operator=(WadFile&&) = default;
  ~WadFile() = default;

  inline Type type() const {
    return this->wad_type;
  }
  inline size_t size() const {
    return this->lumps.size();
  }
  inline const std::vector<std::shared_ptr<const Lump>>& all_lumps() const {
    return this->lumps;
  }

  // Appends a lump. If a lump with the same name already exists, lookups
  // return the new one from now on.
  void add(const std::string& name, std::string&& data);

  bool has_lump(const std::string& name) const;
  // Returns nullptr if there is no lump with this name
  std::shared_ptr<const Lump> find_lump(const std::string& name) const;
  // Throws std::out_of_range if there is no lump with this name
  std::shared_ptr<const Lump> get_lump(const std::string& name) const;

  std::string serialize() const;

private:
  Type wad_type;
  std::vector<std::shared_ptr<const Lump>> lumps;
  std::unordered_map<std::string, size_t> index_for_name;
};

WadFile parse_wad(const std::string& data);
WadFile load_wad(const std::string& filename);

} // namespace WadGfx
