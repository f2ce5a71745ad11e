#include "Image.h"

#include "model/Element.h"

#include <algorithm>
#include <cmath>
#include <cstring>

#include <fmt/format.h>

namespace Tessera {

Image::Image(int width, int height)
    : m_width(std::max(width, 0)), m_height(std::max(height, 0)),
      m_rgba((size_t)m_width * (size_t)m_height * 4u, 0u) {}

Image::Image(int width, int height, std::vector<uint8_t> rgba)
    : m_width(std::max(width, 0)), m_height(std::max(height, 0)),
      m_rgba(std::move(rgba)) {
  m_rgba.resize((size_t)m_width * (size_t)m_height * 4u, 0u);
}

Rgba8 Image::pixel(int x, int y) const {
  if (!contains(x, y))
    return {};
  const uint8_t *p = m_rgba.data() + ((size_t)y * m_width + x) * 4u;
  return {p[0], p[1], p[2], p[3]};
}

void Image::setPixel(int x, int y, const Rgba8 &c) {
  if (!contains(x, y))
    return;
  uint8_t *p = m_rgba.data() + ((size_t)y * m_width + x) * 4u;
  p[0] = c.r;
  p[1] = c.g;
  p[2] = c.b;
  p[3] = c.a;
}

Image Image::crop(int x0, int y0, int x1, int y1) const {
  Image out(x1 - x0, y1 - y0);
  if (out.empty())
    return out;

  const int sx0 = std::clamp(x0, 0, m_width);
  const int sx1 = std::clamp(x1, 0, m_width);
  const int sy0 = std::clamp(y0, 0, m_height);
  const int sy1 = std::clamp(y1, 0, m_height);
  if (sx0 >= sx1 || sy0 >= sy1)
    return out;

  const size_t rowBytes = (size_t)(sx1 - sx0) * 4u;
  for (int y = sy0; y < sy1; ++y) {
    const uint8_t *src = m_rgba.data() + ((size_t)y * m_width + sx0) * 4u;
    uint8_t *dst =
        out.m_rgba.data() + ((size_t)(y - y0) * out.m_width + (sx0 - x0)) * 4u;
    std::memcpy(dst, src, rowBytes);
  }
  return out;
}

std::string formatHexColor(uint8_t r, uint8_t g, uint8_t b) {
  return fmt::format("#{:02X}{:02X}{:02X}", r, g, b);
}

Image sliceIcon(const Image &table, const Vector2 &coordinates) {
  const int x = (int)std::floor(coordinates.x);
  const int y = (int)std::floor(coordinates.y);
  const int size = (int)ElementSize;
  return table.crop(x - ElementMargin, y - ElementMargin,
                    x + size + ElementMargin, y + size + ElementMargin);
}

} // namespace Tessera
