#include <ctype.h>
#include <stdio.h>

#include <format>
#include <memory>
#include <optional>
#include <stdexcept>
#include <phosg/Arguments.hh>
#include <phosg/Filesystem.hh>
#include <phosg/Image.hh>
#include <phosg/Strings.hh>
#include <string>

#include "Cli.hh"
#include "ImageSaver.hh"
#include "Palette.hh"
#include "PatchProvider.hh"
#include "Render.hh"
#include "Sprite.hh"
#include "Texture.hh"
#include "Tile.hh"
#include "WadFile.hh"

using namespace std;
using namespace phosg;
using namespace WadGfx;

void print_usage() {
  fwrite_fmt(stderr, "\
Usage: wad_gfx [options] WAD-FILE COMMAND [NAME]\n\
\n\
Commands:\n\
  flat NAME: extract a flat (64x64 floor/ceiling tile)\n\
  sprite NAME: extract a sprite or patch\n\
  texture NAME: composite and extract a wall texture (searched for in TEXTURE1\n\
      and then TEXTURE2)\n\
  textures [LUMP]: list the textures defined in LUMP (default TEXTURE1), one\n\
      per line as NAME WIDTH HEIGHT NUM-PATCHES\n\
\n\
Color options:\n\
  --palette=N: use palette N from PLAYPAL (0-13 in the original game; default 0)\n\
  --colormap=N: use colormap N from COLORMAP (0-33 in the original game;\n\
      default 0)\n\
\n\
Output options:\n\
  --output=PREFIX: write the image to PREFIX.<ext> (default: the lump name in\n\
      lower case)\n\
  --scale=N: scale the output by N with nearest-neighbor filtering (default 2)\n\
  --anamorphic: don't correct the pixel aspect ratio. Like the original assets,\n\
      the output's pixels will not be square (the intended ratio is 5:6).\n\
  --format=FORMAT: full/f (default), indexed/i, or mask/m. Full color uses the\n\
      alpha channel for transparency. Indexed color has no transparency and\n\
      requires --background. Mask renders drawn pixels as white.\n\
  --background=INDEX: fill undrawn pixels with this palette index\n\
\n\
Sprite options:\n\
  --canvas=WxH: canvas size for the output (default: the sprite's size)\n\
  --pos=X,Y: place the sprite's hotspot at these coordinates (default: the\n\
      sprite's own hotspot, so the sprite fills the default canvas)\n\
  --info: print information about the sprite or texture instead of rendering\n\
      it. For textures, the information is in DeuTex format.\n\
\n\
Texture options:\n\
  --eager-patches: resolve and decode all patches in PNAMES before rendering\n\
\n" WAD_GFX_IMAGE_SAVER_HELP);
}

static string lower_case(const string& s) {
  string ret;
  for (char ch : s) {
    ret.push_back(tolower(static_cast<unsigned char>(ch)));
  }
  return ret;
}

static optional<Texture> find_texture(const WadFile& wad, const string& name) {
  for (const char* dir_name : {"TEXTURE1", "TEXTURE2"}) {
    auto lump = wad.find_lump(dir_name);
    if (!lump) {
      continue;
    }
    TextureDirectory dir(lump->data);
    auto texture = dir.find(name);
    if (texture.has_value()) {
      return texture;
    }
  }
  return nullopt;
}

int main(int argc, char* argv[]) {
  Arguments args(&argv[1], argc - 1);

  if (args.get<bool>("help") || argc <= 1) {
    print_usage();
    return 0;
  }

  string wad_filename = args.get<string>(0, true);
  string command = args.get<string>(1, true);
  ImageSaver image_saver(args.get<string>("image-format", false));
  RenderOptions opts = parse_render_options(args);
  bool info = args.get<bool>("info");

  auto wad = make_shared<const WadFile>(load_wad(wad_filename));
  log_info_f("Loaded {} with {} lumps", wad_filename, wad->size());

  if (command == "textures") {
    string dir_name = args.get<string>(2, false);
    auto lump = wad->get_lump(dir_name.empty() ? "TEXTURE1" : normalize_lump_name(dir_name));
    TextureDirectory dir(lump->data);
    for (size_t z = 0; z < dir.size(); z++) {
      auto texture = dir.texture(z);
      fwrite_fmt(stdout, "{}\n", texture_summary(texture));
    }
    return 0;
  }

  string name = normalize_lump_name(args.get<string>(2, true));
  string output_prefix = args.get<string>("output", false);
  if (output_prefix.empty()) {
    output_prefix = lower_case(name);
  }

  auto load_colors = [&]() -> pair<vector<Color8>, vector<uint8_t>> {
    return make_pair(
        palette_bank(wad->get_lump("PLAYPAL")->data, opts.palette_index),
        colormap_bank(wad->get_lump("COLORMAP")->data, opts.colormap_index));
  };

  if (command == "flat") {
    auto lump = wad->get_lump(name);
    Tile tile = decode_tile(lump->data);
    auto [palette, colormap] = load_colors();
    string filename = image_saver.save_image(render_tile(tile, palette, colormap, opts), output_prefix);
    fwrite_fmt(stderr, "... {}\n", filename);

  } else if (command == "sprite") {
    auto lump = wad->get_lump(name);
    Sprite sprite = decode_sprite(lump->data);
    if (info) {
      fwrite_fmt(stdout, "Dimensions: {}x{}\nOrigin: {},{}\nSize (b): {}\n",
          sprite.width(), sprite.height(), sprite.left(), sprite.top(), sprite.size());
      return 0;
    }
    auto [palette, colormap] = load_colors();
    string filename = image_saver.save_image(render_sprite(sprite, palette, colormap, opts), output_prefix);
    fwrite_fmt(stderr, "... {}\n", filename);

  } else if (command == "texture") {
    auto texture = find_texture(*wad, name);
    if (!texture.has_value()) {
      throw out_of_range(std::format("texture {} not found in TEXTURE1 or TEXTURE2", name));
    }
    auto pnames = parse_pnames(wad->get_lump("PNAMES")->data);
    if (info) {
      fwrite_fmt(stdout, "{}", texture_definition(*texture, pnames));
      return 0;
    }

    unique_ptr<PatchProvider> patch_provider;
    if (args.get<bool>("eager-patches")) {
      auto eager_provider = make_unique<EagerPatchProvider>(wad, pnames);
      log_info_f("Resolved {} of {} patches", eager_provider->num_resolved(), pnames.size());
      patch_provider = std::move(eager_provider);
    } else {
      patch_provider = make_unique<LazyPatchProvider>(wad, pnames);
    }

    string texture_data = render_texture(*texture, *patch_provider);
    Sprite sprite = decode_sprite(texture_data);
    // The composited texture is already positioned, so canvas and position
    // options don't apply
    RenderOptions texture_opts = opts;
    texture_opts.canvas_size.reset();
    texture_opts.position.reset();
    auto [palette, colormap] = load_colors();
    string filename = image_saver.save_image(render_sprite(sprite, palette, colormap, texture_opts), output_prefix);
    fwrite_fmt(stderr, "... {}\n", filename);

  } else {
    fwrite_fmt(stderr, "unknown command: {}\n", command);
    print_usage();
    return 2;
  }

  return 0;
}
