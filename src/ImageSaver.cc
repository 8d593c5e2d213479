#include "ImageSaver.hh"

#include <format>
#include <stdexcept>

using namespace std;
using namespace phosg;

namespace WadGfx {

ImageSaver::ImageSaver(const string& format_name) {
  if (format_name.empty() || format_name == "bmp") {
    this->image_format = ImageFormat::WINDOWS_BITMAP;
  } else if (format_name == "ppm") {
    this->image_format = ImageFormat::COLOR_PPM;
  } else if (format_name == "png") {
    this->image_format = ImageFormat::PNG;
  } else {
    throw invalid_argument(std::format("unknown image format: {}", format_name));
  }
}

} // namespace WadGfx
