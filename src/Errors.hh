#pragma once

#include <stdexcept>
#include <string>

namespace WadGfx {

// The buffer is too short for the structure it declares, or an offset inside
// it points outside the buffer.
class malformed_asset : public std::runtime_error {
public:
  explicit malformed_asset(const std::string& what) : runtime_error(what) {}
  ~malformed_asset() = default;
};

// A field that must hold a fixed value in this asset family holds something
// else (e.g. a patch's step direction or colormap).
class unsupported_field : public std::runtime_error {
public:
  explicit unsupported_field(const std::string& what) : runtime_error(what) {}
  ~unsupported_field() = default;
};

// A texture refers to a patch that the patch provider cannot supply.
class unresolved_patch : public std::runtime_error {
public:
  explicit unresolved_patch(const std::string& what) : runtime_error(what) {}
  ~unresolved_patch() = default;
};

// A run of opaque pixels does not fit in the post format's 1-byte fields.
class unencodable_run : public std::runtime_error {
public:
  explicit unencodable_run(const std::string& what) : runtime_error(what) {}
  ~unencodable_run() = default;
};

} // namespace WadGfx
