#include <gtest/gtest.h>

#include <phosg/Arguments.hh>
#include <stdexcept>
#include <string>
#include <vector>

#include "Cli.hh"
#include "ImageSaver.hh"

using namespace std;
using namespace WadGfx;

TEST(CliTest, ParsePair) {
  EXPECT_EQ((IntPair{320, 200}), parse_cli_pair("320x200"));
  EXPECT_EQ((IntPair{100, 20}), parse_cli_pair("100,20"));
  EXPECT_EQ((IntPair{-16, -4}), parse_cli_pair("-16,-4"));
  EXPECT_EQ((IntPair{0, 0}), parse_cli_pair("0x0"));
}

TEST(CliTest, ParsePairErrors) {
  EXPECT_THROW(parse_cli_pair("320"), invalid_argument);
  EXPECT_THROW(parse_cli_pair("1x2x3"), invalid_argument);
  EXPECT_THROW(parse_cli_pair("1,2x3"), invalid_argument);
  EXPECT_THROW(parse_cli_pair("x200"), invalid_argument);
  EXPECT_THROW(parse_cli_pair("320x"), invalid_argument);
  EXPECT_THROW(parse_cli_pair("a,b"), invalid_argument);
}

TEST(CliTest, ImageFormatNames) {
  EXPECT_EQ(ImageFormat::WINDOWS_BITMAP, ImageSaver().get_image_format());
  EXPECT_EQ(ImageFormat::WINDOWS_BITMAP, ImageSaver("").get_image_format());
  EXPECT_EQ(ImageFormat::WINDOWS_BITMAP, ImageSaver("bmp").get_image_format());
  EXPECT_EQ(ImageFormat::COLOR_PPM, ImageSaver("ppm").get_image_format());
  EXPECT_EQ(ImageFormat::PNG, ImageSaver("png").get_image_format());
  EXPECT_THROW(ImageSaver("gif"), invalid_argument);
}

static RenderOptions parse_options(vector<string> args_strs) {
  vector<char*> argv;
  for (auto& arg : args_strs) {
    argv.emplace_back(arg.data());
  }
  phosg::Arguments args(argv.data(), argv.size());
  return parse_render_options(args);
}

TEST(CliTest, RenderOptions) {
  auto defaults = parse_options({});
  EXPECT_EQ(0, defaults.palette_index);
  EXPECT_EQ(0, defaults.colormap_index);
  EXPECT_EQ(2, defaults.scale);
  EXPECT_FALSE(defaults.anamorphic);
  EXPECT_EQ(OutputFormat::FULL, defaults.format);
  EXPECT_FALSE(defaults.background.has_value());
  EXPECT_FALSE(defaults.canvas_size.has_value());
  EXPECT_FALSE(defaults.position.has_value());

  auto opts = parse_options({"--palette=3", "--scale=4", "--anamorphic", "--format=i", "--background=7",
      "--canvas=320x200", "--pos=-2147483648,2147483647"});
  EXPECT_EQ(3, opts.palette_index);
  EXPECT_EQ(4, opts.scale);
  EXPECT_TRUE(opts.anamorphic);
  EXPECT_EQ(OutputFormat::INDEXED, opts.format);
  EXPECT_EQ(7, opts.background.value());
  EXPECT_EQ((IntPair{320, 200}), opts.canvas_size.value());
  EXPECT_EQ((IntPair{INT32_MIN, INT32_MAX}), opts.position.value());
}

TEST(CliTest, RenderOptionsRangeChecks) {
  // Positions must not wrap around when narrowed to canvas coordinates
  EXPECT_THROW(parse_options({"--pos=4294967298,0"}), invalid_argument);
  EXPECT_THROW(parse_options({"--pos=0,-2147483649"}), invalid_argument);
  EXPECT_THROW(parse_options({"--pos=2147483648,0"}), invalid_argument);
  EXPECT_THROW(parse_options({"--canvas=0x10"}), invalid_argument);
  EXPECT_THROW(parse_options({"--canvas=65536x10"}), invalid_argument);
  EXPECT_THROW(parse_options({"--background=256"}), invalid_argument);
  EXPECT_THROW(parse_options({"--scale=0"}), invalid_argument);
  EXPECT_THROW(parse_options({"--format=rgb"}), invalid_argument);
}
