#include "CanvasOverlay.h"

#include "InteractionController.h"
#include "view/CoordinateMapper.h"
#include "view/SpatialPicker.h"

namespace Tessera {

static Rgba8 embedColor(uint32_t rgb, uint8_t alpha) {
  return {(uint8_t)((rgb >> 16) & 0xFF), (uint8_t)((rgb >> 8) & 0xFF),
          (uint8_t)(rgb & 0xFF), alpha};
}

CanvasOverlay buildCanvasOverlay(const Table &table,
                                 const InteractionController &controller,
                                 const ViewportState &viewport) {
  const Camera &camera = controller.camera();
  const CoordinateMapper map = CoordinateMapper::from(camera, viewport);

  CanvasOverlay out{};
  out.imageMin = map.worldToScreen({0.0f, 0.0f});
  out.imageMax = map.worldToScreen(table.canvasSize);

  const float thickness = camera.zoom();
  const bool outlines = camera.zoom() > OutlineMinZoom;
  const ElementID hovered = controller.hoveredElement();
  const ElementStore &store = table.elements;
  const Vector2 grow{1.0f, 1.0f};

  for (size_t i = 0; i < store.size(); ++i) {
    const Element &e = store.at(i);
    const Vector2 a = e.position + HitBoxMin;
    const Vector2 b = e.position + HitBoxMax;

    if (store.idAt(i) == hovered) {
      const Vector2 ha = map.worldToScreen(a - grow);
      const Vector2 hb = map.worldToScreen(b + grow);
      out.quads.push_back({ha, hb, {255, 255, 255, 51}, true, thickness});
      out.quads.push_back(
          {ha, hb, embedColor(e.info.embedColor, 255), false, thickness});
      continue;
    }

    if (!outlines)
      continue;

    const Vector2 sa = map.worldToScreen(a);
    const Vector2 sb = map.worldToScreen(b);
    out.quads.push_back({sa, sb, {0, 0, 0, 25}, false, thickness});
    out.quads.push_back({sa, sb, {255, 255, 255, 25}, false, thickness});
    out.quads.push_back(
        {sa, sb, embedColor(e.info.embedColor, 153), false, thickness});
  }
  return out;
}

} // namespace Tessera
