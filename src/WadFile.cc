#include "WadFile.hh"

#include <ctype.h>
#include <string.h>

#include <format>
#include <phosg/Encoding.hh>
#include <phosg/Filesystem.hh>
#include <phosg/Strings.hh>
#include <stdexcept>

#include "Errors.hh"

using namespace std;
using namespace phosg;

namespace WadGfx {

struct WadHeader {
  char magic[4];
  le_uint32_t num_lumps;
  le_uint32_t directory_offset;
} __attribute__((packed));

struct WadDirectoryEntry {
  le_uint32_t offset;
  le_uint32_t size;
  char name[8];
} __attribute__((packed));

string normalize_lump_name(const string& name) {
  if (name.empty() || name.size() > LUMP_NAME_LENGTH) {
    throw invalid_argument(std::format("lump name \"{}\" must be 1-{} characters long", name, LUMP_NAME_LENGTH));
  }
  string ret;
  for (char ch : name) {
    if (ch == '\0') {
      throw invalid_argument("lump name contains a NUL character");
    }
    ret.push_back(toupper(static_cast<unsigned char>(ch)));
  }
  return ret;
}

string lump_name_from_bytes(const void* data, size_t size) {
  const char* chars = reinterpret_cast<const char*>(data);
  string ret;
  for (size_t z = 0; z < size && chars[z] != '\0'; z++) {
    ret.push_back(toupper(static_cast<unsigned char>(chars[z])));
  }
  return ret;
}

WadFile::Lump::Lump(const string& name, string&& data)
    : name(name),
      data(std::move(data)) {}

WadFile::WadFile(Type type) : wad_type(type) {}

void WadFile::add(const string& name, string&& data) {
  string key = normalize_lump_name(name);
  this->lumps.emplace_back(make_shared<const Lump>(key, std::move(data)));
  this->index_for_name[key] = this->lumps.size() - 1;
}

bool WadFile::has_lump(const string& name) const {
  return this->find_lump(name) != nullptr;
}

shared_ptr<const WadFile::Lump> WadFile::find_lump(const string& name) const {
  auto it = this->index_for_name.find(lump_name_from_bytes(name.data(), name.size()));
  if (it == this->index_for_name.end()) {
    return nullptr;
  }
  return this->lumps[it->second];
}

shared_ptr<const WadFile::Lump> WadFile::get_lump(const string& name) const {
  auto ret = this->find_lump(name);
  if (!ret) {
    throw out_of_range(std::format("lump {} not found", name));
  }
  return ret;
}

string WadFile::serialize() const {
  StringWriter data_w;
  vector<WadDirectoryEntry> entries;
  for (const auto& lump : this->lumps) {
    auto& entry = entries.emplace_back();
    entry.offset = sizeof(WadHeader) + data_w.size();
    entry.size = lump->data.size();
    memset(entry.name, 0, sizeof(entry.name));
    memcpy(entry.name, lump->name.data(), min<size_t>(lump->name.size(), sizeof(entry.name)));
    data_w.write(lump->data);
  }

  WadHeader header;
  memcpy(header.magic, (this->wad_type == Type::IWAD) ? "IWAD" : "PWAD", 4);
  header.num_lumps = this->lumps.size();
  header.directory_offset = sizeof(WadHeader) + data_w.size();

  StringWriter w;
  w.put(header);
  w.write(data_w.str());
  for (const auto& entry : entries) {
    w.put(entry);
  }
  return std::move(w.str());
}

WadFile parse_wad(const string& data) {
  if (data.size() < sizeof(WadHeader)) {
    throw malformed_asset(std::format("file is too small to be a WAD ({} bytes)", data.size()));
  }

  StringReader r(data);
  const auto& header = r.get<WadHeader>();
  WadFile::Type type;
  if (!memcmp(header.magic, "IWAD", 4)) {
    type = WadFile::Type::IWAD;
  } else if (!memcmp(header.magic, "PWAD", 4)) {
    type = WadFile::Type::PWAD;
  } else {
    throw malformed_asset("file does not begin with IWAD or PWAD");
  }

  uint64_t directory_end = static_cast<uint64_t>(header.directory_offset) +
      static_cast<uint64_t>(header.num_lumps) * sizeof(WadDirectoryEntry);
  if (directory_end > data.size()) {
    throw malformed_asset(std::format(
        "lump directory ({} entries at offset {}) extends beyond end of file ({} bytes)",
        header.num_lumps.load(), header.directory_offset.load(), data.size()));
  }

  WadFile ret(type);
  r.go(header.directory_offset);
  for (size_t z = 0; z < header.num_lumps; z++) {
    const auto& entry = r.get<WadDirectoryEntry>();
    uint64_t lump_end = static_cast<uint64_t>(entry.offset) + entry.size;
    string name = lump_name_from_bytes(entry.name);
    if (lump_end > data.size()) {
      throw malformed_asset(std::format(
          "lump {} ({}) at offset {} with size {} extends beyond end of file",
          z, name, entry.offset.load(), entry.size.load()));
    }
    if (name.empty()) {
      throw malformed_asset(std::format("lump {} has an empty name", z));
    }
    ret.add(name, data.substr(entry.offset, entry.size));
  }
  return ret;
}

WadFile load_wad(const string& filename) {
  return parse_wad(load_file(filename));
}

} // namespace WadGfx
