#include "InteractionController.h"

#include "core/Log.h"
#include "input/Keybinds.h"
#include "view/CoordinateMapper.h"
#include "view/SpatialPicker.h"

namespace Tessera {

static constexpr float TableSwitchZoom = 4.0f;

InteractionController::InteractionController(const CameraTuning &tuning,
                                             std::vector<NavBinding> bindings)
    : m_camera(tuning), m_bindings(std::move(bindings)),
      m_held(m_bindings.size(), 0) {}

InteractionEvents InteractionController::update(float dt,
                                                const InputState &input,
                                                const ViewportState &viewport,
                                                bool wantTextInput,
                                                Table *table) {
  InteractionEvents out{};

  m_camera.tick(dt);

  if (!wantTextInput)
    processKeys(input, table, out);

  processMouse(input, viewport, table, out);
  return out;
}

void InteractionController::processKeys(const InputState &input, Table *table,
                                        InteractionEvents &out) {
  // Ctrl chords belong to application shortcuts.
  const bool ctrl = hasMod(heldMods(input), KeyMod::Ctrl);

  // Press before release so a tap inside one frame leaves no acceleration.
  // A key seen pressed that is no longer down counts as released even if
  // its release edge was never delivered.
  for (size_t i = 0; i < m_bindings.size(); ++i) {
    const NavBinding &b = m_bindings[i];
    if (!ctrl && input.isPressed(b.key)) {
      onPress(b.action, table, out);
      m_held[i] = 1;
    }
    if (input.isReleased(b.key) || (m_held[i] && !input.isDown(b.key))) {
      onRelease(b.action);
      m_held[i] = 0;
    }
  }
}

void InteractionController::onPress(NavAction action, Table *table,
                                    InteractionEvents &out) {
  // Constant screen-space speed at every zoom level.
  const float accel = m_camera.tuning().speed / m_camera.zoom();

  switch (action) {
  case NavAction::MoveUp:
    m_camera.releaseEasing();
    m_camera.setAccelerationY(-accel);
    break;
  case NavAction::MoveDown:
    m_camera.releaseEasing();
    m_camera.setAccelerationY(accel);
    break;
  case NavAction::MoveLeft:
    m_camera.releaseEasing();
    m_camera.setAccelerationX(-accel);
    break;
  case NavAction::MoveRight:
    m_camera.releaseEasing();
    m_camera.setAccelerationX(accel);
    break;
  case NavAction::ZoomIn:
    m_camera.setTargetZoom(m_camera.targetZoom() * 2.0f);
    break;
  case NavAction::ZoomOut:
    m_camera.setTargetZoom(m_camera.targetZoom() / 2.0f);
    break;
  case NavAction::PreviousElement:
    if (table)
      navigate(*table, -1);
    break;
  case NavAction::NextElement:
    if (table)
      navigate(*table, 1);
    break;
  case NavAction::RecenterElement:
    if (table)
      navigate(*table, 0);
    break;
  case NavAction::ColorPick:
    m_colorPickArmed = true;
    break;
  case NavAction::InsertElement:
    out.insertAt = m_camera.position();
    break;
  }
}

void InteractionController::onRelease(NavAction action) {
  switch (action) {
  case NavAction::MoveUp:
  case NavAction::MoveDown:
    m_camera.setAccelerationY(0.0f);
    break;
  case NavAction::MoveLeft:
  case NavAction::MoveRight:
    m_camera.setAccelerationX(0.0f);
    break;
  default:
    break;
  }
}

void InteractionController::processMouse(const InputState &input,
                                         const ViewportState &viewport,
                                         Table *table,
                                         InteractionEvents &out) {
  const CoordinateMapper mapper = CoordinateMapper::from(m_camera, viewport);
  m_worldMouse =
      mapper.screenToWorld({(float)input.mouseX, (float)input.mouseY});
  m_hovered = InvalidElement;

  if (!table) {
    m_dragging = false;
    m_wasDragging = false;
    return;
  }

  if (m_colorPickArmed &&
      m_worldMouse.within(Vector2{}, table->canvasSize)) {
    out.colorPickAt = m_worldMouse.floor();
    m_colorPickArmed = false;
  }

  ElementStore &store = table->elements;
  const bool primary = input.isPressed(Key::MouseLeft);
  const bool secondary = input.isPressed(Key::MouseRight);

  std::optional<size_t> hit;
  if (viewport.hovered)
    hit = hitTest(m_worldMouse, store.elements());

  bool justStartedDragging = false;
  if (hit) {
    m_hovered = store.idAt(*hit);
    if (primary)
      m_activeElement = m_hovered;
    if (secondary && !m_wasDragging) {
      m_activeElement = m_hovered;
      m_dragging = true;
      m_dragOffset = store.at(*hit).position - m_worldMouse;
      justStartedDragging = true;
    }
  } else if (viewport.hovered && primary && !m_dragging) {
    m_activeElement = InvalidElement;
  }

  m_wasDragging = m_dragging;
  if (!m_dragging || justStartedDragging)
    return;

  Element *el = store.find(m_activeElement);
  if (!el || secondary) {
    m_dragging = false;
    return;
  }

  const Vector2 p = (m_worldMouse + m_dragOffset).floor();
  if (p != el->position) {
    el->position = p;
    out.elementMoved = true;
  }
}

void InteractionController::navigate(Table &table, int offset) {
  const ElementStore &store = table.elements;
  if (store.empty())
    return;

  const Vector2 reference =
      m_camera.easingTarget().value_or(m_camera.position());
  const std::optional<size_t> closest = nearest(reference, store.elements());
  if (!closest)
    return;

  const size_t target = advance(*closest, offset, store.size());
  Log::Debug("Closest to {}, moving to {}", *closest, target);

  m_activeElement = store.idAt(target);
  m_camera.easeTo(store.at(target).position + ElementCenter);
}

void InteractionController::switchTable(Table &table) {
  m_activeElement = InvalidElement;
  m_hovered = InvalidElement;
  m_dragging = false;
  m_wasDragging = false;

  m_camera.setVelocity({});
  if (!table.elements.empty())
    m_camera.easeTo(table.elements.at(0).position);
  m_camera.setTargetZoom(TableSwitchZoom);
}

} // namespace Tessera
