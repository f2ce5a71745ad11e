#pragma once

#include "NavBindings.h"
#include "input/InputState.h"
#include "math/Vector2.h"
#include "model/ElementID.h"
#include "model/Table.h"
#include "view/Camera.h"
#include "view/ViewportState.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace Tessera {

// Requests the controller hands to its owner after a frame.
struct InteractionEvents final {
  std::optional<Vector2> insertAt;    // create an element here
  std::optional<Vector2> colorPickAt; // sample the canvas at this pixel
  bool elementMoved = false;          // a drag changed a position
};

// Turns per-frame input into camera motion, selection and dragging.
// Owns the session camera. Element handles are resolved against the table
// passed to update(), so a removed element simply stops being selected.
class InteractionController final {
public:
  explicit InteractionController(
      const CameraTuning &tuning = {},
      std::vector<NavBinding> bindings = defaultNavBindings());

  // One frame: camera tick, then keys (unless text input is active), then
  // mouse. table may be null when nothing is loaded.
  InteractionEvents update(float dt, const InputState &input,
                           const ViewportState &viewport, bool wantTextInput,
                           Table *table);

  // Select the element offset places from the one nearest the camera
  // (-1 previous, +1 next, 0 nearest) and ease to it.
  void navigate(Table &table, int offset);

  // Activate another table: drop selection and drag, fly to the top-left
  // corner of its first element and zoom to 4x.
  void switchTable(Table &table);

  Camera &camera() { return m_camera; }
  const Camera &camera() const { return m_camera; }

  const Vector2 &worldMouse() const { return m_worldMouse; }
  ElementID hoveredElement() const { return m_hovered; }

  ElementID activeElement() const { return m_activeElement; }
  void setActiveElement(ElementID id) { m_activeElement = id; }
  void clearActiveElement() { m_activeElement = InvalidElement; }

  bool isDragging() const { return m_dragging; }
  const Vector2 &dragOffset() const { return m_dragOffset; }

  bool colorPickArmed() const { return m_colorPickArmed; }

private:
  void processKeys(const InputState &input, Table *table,
                   InteractionEvents &out);
  void onPress(NavAction action, Table *table, InteractionEvents &out);
  void onRelease(NavAction action);
  void processMouse(const InputState &input, const ViewportState &viewport,
                    Table *table, InteractionEvents &out);

  Camera m_camera;
  std::vector<NavBinding> m_bindings;
  std::vector<uint8_t> m_held; // per binding

  Vector2 m_worldMouse{};
  ElementID m_hovered = InvalidElement;
  ElementID m_activeElement = InvalidElement;

  bool m_dragging = false;
  bool m_wasDragging = false;
  Vector2 m_dragOffset{};

  bool m_colorPickArmed = false;
};

} // namespace Tessera
