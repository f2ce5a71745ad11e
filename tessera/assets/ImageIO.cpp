#include "ImageIO.h"

#include <filesystem>
#include <system_error>
#include <vector>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace Tessera {

std::expected<Image, std::string> ImageIO::load(const std::string &path) {
  int w = 0, h = 0, comp = 0;
  stbi_uc *pixels = stbi_load(path.c_str(), &w, &h, &comp, 4);
  if (!pixels) {
    const char *why = stbi_failure_reason();
    return std::unexpected("Failed to load image '" + path +
                           "': " + (why ? why : "unknown error"));
  }

  std::vector<uint8_t> rgba(pixels, pixels + (size_t)w * (size_t)h * 4u);
  stbi_image_free(pixels);
  return Image(w, h, std::move(rgba));
}

std::expected<void, std::string> ImageIO::savePng(const std::string &path,
                                                  const Image &image) {
  if (image.empty())
    return std::unexpected("Refusing to write empty image: " + path);

  std::filesystem::path p = path;
  if (p.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
    if (ec)
      return std::unexpected("Cannot create " + p.parent_path().string() +
                             ": " + ec.message());
  }

  const int ok = stbi_write_png(path.c_str(), image.width(), image.height(), 4,
                                image.data().data(), image.width() * 4);
  if (!ok)
    return std::unexpected("Failed to write PNG: " + path);
  return {};
}

} // namespace Tessera
