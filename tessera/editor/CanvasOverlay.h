#pragma once

#include "image/Image.h"
#include "math/Vector2.h"
#include "view/ViewportState.h"

#include <vector>

namespace Tessera {

class InteractionController;
struct Table;

struct CanvasQuad final {
  Vector2 min{}; // screen pixels
  Vector2 max{};
  Rgba8 color{};
  bool filled = false;
  float thickness = 1.0f;
};

// Screen-space geometry of one canvas frame: where the table image goes and
// the element outlines / hover highlight on top of it.
struct CanvasOverlay final {
  Vector2 imageMin{};
  Vector2 imageMax{};
  std::vector<CanvasQuad> quads;
};

// Outlines appear once zoomed in past this.
inline constexpr float OutlineMinZoom = 1.01f;

// Built from the controller after its update so the frame shows this frame's
// camera, hover and drag state.
CanvasOverlay buildCanvasOverlay(const Table &table,
                                 const InteractionController &controller,
                                 const ViewportState &viewport);

} // namespace Tessera
