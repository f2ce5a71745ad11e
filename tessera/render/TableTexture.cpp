#include "TableTexture.h"

#include <glad/glad.h>

#include <utility>

namespace Tessera {

TableTexture::~TableTexture() { release(); }

TableTexture::TableTexture(TableTexture &&other) noexcept
    : m_tex(std::exchange(other.m_tex, 0u)), m_w(std::exchange(other.m_w, 0)),
      m_h(std::exchange(other.m_h, 0)) {}

TableTexture &TableTexture::operator=(TableTexture &&other) noexcept {
  if (this != &other) {
    release();
    m_tex = std::exchange(other.m_tex, 0u);
    m_w = std::exchange(other.m_w, 0);
    m_h = std::exchange(other.m_h, 0);
  }
  return *this;
}

void TableTexture::upload(const Image &image) {
  if (image.empty()) {
    release();
    return;
  }

  m_w = image.width();
  m_h = image.height();

  if (!m_tex) {
    GLuint tex = 0;
    glGenTextures(1, &tex);
    m_tex = tex;
  }
  glBindTexture(GL_TEXTURE_2D, m_tex);

  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);

  glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
  glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, m_w, m_h, 0, GL_RGBA,
               GL_UNSIGNED_BYTE, image.data().data());

  glBindTexture(GL_TEXTURE_2D, 0);
}

void TableTexture::release() {
  if (m_tex) {
    GLuint tex = m_tex;
    glDeleteTextures(1, &tex);
    m_tex = 0;
  }
  m_w = 0;
  m_h = 0;
}

} // namespace Tessera
