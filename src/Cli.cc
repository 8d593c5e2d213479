#include "Cli.hh"

#include <stdlib.h>

#include <format>
#include <phosg/Strings.hh>
#include <stdexcept>

using namespace std;
using namespace phosg;

namespace WadGfx {

static int64_t parse_cli_int(const string& str, const string& context) {
  if (str.empty()) {
    throw invalid_argument(std::format("missing number in '{}'", context));
  }
  char* end;
  long long value = strtoll(str.c_str(), &end, 10);
  if (*end != '\0') {
    throw invalid_argument(std::format("invalid number '{}' in '{}'", str, context));
  }
  return value;
}

IntPair parse_cli_pair(const string& str) {
  size_t sep_offset = str.find_first_of("x,");
  if (sep_offset == string::npos) {
    throw invalid_argument(std::format(
        "'{}' must be two integers separated by `x` or `,`, e.g. 320x200 or 100,200", str));
  }
  if (str.find_first_of("x,", sep_offset + 1) != string::npos) {
    throw invalid_argument(std::format("'{}' contains more than one separator", str));
  }
  IntPair ret;
  ret.x = parse_cli_int(str.substr(0, sep_offset), str);
  ret.y = parse_cli_int(str.substr(sep_offset + 1), str);
  return ret;
}

RenderOptions parse_render_options(Arguments& args) {
  RenderOptions ret;
  ret.palette_index = args.get<size_t>("palette", 0);
  ret.colormap_index = args.get<size_t>("colormap", 0);
  ret.scale = args.get<uint32_t>("scale", 2);
  if (ret.scale == 0) {
    throw invalid_argument("--scale must be at least 1");
  }
  ret.anamorphic = args.get<bool>("anamorphic");

  const auto& format_str = args.get<string>("format", false);
  if (!format_str.empty()) {
    ret.format = output_format_for_name(format_str);
  }

  const auto& background_str = args.get<string>("background", false);
  if (!background_str.empty()) {
    int64_t background = parse_cli_int(background_str, "--background");
    if (background < 0 || background > 0xFF) {
      throw invalid_argument("--background must be a color index (0-255)");
    }
    ret.background = background;
  }

  const auto& canvas_str = args.get<string>("canvas", false);
  if (!canvas_str.empty()) {
    ret.canvas_size = parse_cli_pair(canvas_str);
    if (ret.canvas_size->x <= 0 || ret.canvas_size->x > 0xFFFF ||
        ret.canvas_size->y <= 0 || ret.canvas_size->y > 0xFFFF) {
      throw invalid_argument("--canvas dimensions must be between 1 and 65535");
    }
  }

  const auto& pos_str = args.get<string>("pos", false);
  if (!pos_str.empty()) {
    ret.position = parse_cli_pair(pos_str);
    if (!ret.position->fits_int32()) {
      throw invalid_argument(std::format("--pos coordinates must be between {} and {}", INT32_MIN, INT32_MAX));
    }
  }

  return ret;
}

} // namespace WadGfx
