#pragma once

#include "math/Vector2.h"

namespace Tessera {

// The interaction surface the canvas is drawn into, in window pixels.
struct ViewportState {
  bool hovered = false;

  Vector2 origin{}; // top-left corner
  Vector2 size{1.0f, 1.0f};
};

} // namespace Tessera
