#pragma once

#include "math/Vector2.h"

#include <cstdint>
#include <string>
#include <vector>

namespace Tessera {

struct Rgba8 final {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;
  uint8_t a = 0;

  bool operator==(const Rgba8 &) const = default;
};

// Tightly packed RGBA8, row-major, top-left origin.
class Image final {
public:
  Image() = default;
  Image(int width, int height);
  Image(int width, int height, std::vector<uint8_t> rgba);

  int width() const { return m_width; }
  int height() const { return m_height; }
  bool empty() const { return m_width <= 0 || m_height <= 0; }
  Vector2 size() const { return {(float)m_width, (float)m_height}; }

  bool contains(int x, int y) const {
    return x >= 0 && y >= 0 && x < m_width && y < m_height;
  }

  // Transparent black outside the image.
  Rgba8 pixel(int x, int y) const;
  void setPixel(int x, int y, const Rgba8 &c);

  // Region [x0, x1) x [y0, y1); parts outside the image stay transparent.
  Image crop(int x0, int y0, int x1, int y1) const;

  const std::vector<uint8_t> &data() const { return m_rgba; }

private:
  int m_width = 0;
  int m_height = 0;
  std::vector<uint8_t> m_rgba;
};

// "#RRGGBB"
std::string formatHexColor(uint8_t r, uint8_t g, uint8_t b);

// The element at coordinates plus its 1px margin on every side.
Image sliceIcon(const Image &table, const Vector2 &coordinates);

} // namespace Tessera
