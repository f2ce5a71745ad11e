#pragma once

#include "image/Image.h"

#include <expected>
#include <string>

namespace Tessera {

struct ImageIO final {
  // Any format stb_image reads, converted to RGBA8.
  static std::expected<Image, std::string> load(const std::string &path);
  static std::expected<void, std::string> savePng(const std::string &path,
                                                  const Image &image);
};

} // namespace Tessera
