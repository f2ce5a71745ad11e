#pragma once

#include "view/ViewportState.h"

namespace Tessera {

class InteractionController;
class TableTexture;
struct Table;

// Full-window host for the active table. A frame is split in two:
// beginSurface() opens the window and records the viewport the controller
// maps the mouse with; draw() renders the table and overlay from the
// updated controller and closes the window.
class CanvasView final {
public:
  void beginSurface();
  void draw(const Table *table, const TableTexture *texture,
            const InteractionController &controller);

  const ViewportState &viewport() const { return m_viewport; }

private:
  ViewportState m_viewport{};
};

} // namespace Tessera
