#pragma once

#include "ElementStore.h"
#include "math/Vector2.h"

#include <string>

namespace Tessera {

// A named composite image with element icons placed on it.
struct Table final {
  std::string name;
  std::string imagePath; // relative to the images directory
  Vector2 canvasSize{};
  ElementStore elements;
};

} // namespace Tessera
