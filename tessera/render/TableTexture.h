#pragma once

#include "image/Image.h"

#include <cstdint>

namespace Tessera {

// GPU copy of a table image, sampled with nearest filtering so zoomed-in
// pixels stay crisp.
class TableTexture final {
public:
  TableTexture() = default;
  ~TableTexture();

  TableTexture(const TableTexture &) = delete;
  TableTexture &operator=(const TableTexture &) = delete;
  TableTexture(TableTexture &&other) noexcept;
  TableTexture &operator=(TableTexture &&other) noexcept;

  void upload(const Image &image);
  void release();

  bool valid() const { return m_tex != 0; }
  uint32_t glTexture() const { return m_tex; } // GLuint
  int width() const { return m_w; }
  int height() const { return m_h; }

private:
  uint32_t m_tex = 0;
  int m_w = 0;
  int m_h = 0;
};

} // namespace Tessera
