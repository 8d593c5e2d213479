#pragma once

#include <phosg/Filesystem.hh>
#include <phosg/Image.hh>
#include <string>

namespace WadGfx {

using namespace phosg;

// clang-format off
#define WAD_GFX_IMAGE_SAVER_HELP \
"Image output options:\n\
  --image-format=bmp\n\
      Save images as Windows bitmaps (default)\n\
  --image-format=ppm\n\
      Save images as portable pixmaps (transparency is lost)\n\
  --image-format=png\n\
      Save images as PNG files\n\
\n"
// clang-format on

class ImageSaver {
public:
  ImageSaver() : image_format(ImageFormat::WINDOWS_BITMAP) {}
  // Accepts bmp, ppm or png; an empty name selects the default (bmp)
  explicit ImageSaver(const std::string& format_name);

  inline ImageFormat get_image_format() const {
    return this->image_format;
  }

  // Returns the filename *with* extension (e.g. for logging)
  template <PixelFormat Format>
  [[nodiscard]] std::string save_image(const Image<Format>& img, const std::string& file_name_without_ext) const {
    std::string file_name = file_name_without_ext + "." + file_extension_for_image_format(this->image_format);
    save_file(file_name, img.serialize(this->image_format));
    return file_name;
  }

private:
  ImageFormat image_format;
};

} // namespace WadGfx
