#pragma once

#include "input/KeyCodes.h"

#include <cstdint>
#include <vector>

namespace Tessera {

enum class NavAction : uint8_t {
  MoveUp,
  MoveDown,
  MoveLeft,
  MoveRight,
  ZoomIn,
  ZoomOut,
  PreviousElement,
  NextElement,
  RecenterElement,
  ColorPick,
  InsertElement,
};

struct NavBinding final {
  Key key = Key::Unknown;
  NavAction action = NavAction::MoveUp;
};

// Arrows/WASD move, = and - zoom, , . / cycle through elements,
// \ picks a color, Enter inserts an element.
inline std::vector<NavBinding> defaultNavBindings() {
  return {
      {Key::ArrowUp, NavAction::MoveUp},
      {Key::W, NavAction::MoveUp},
      {Key::ArrowDown, NavAction::MoveDown},
      {Key::S, NavAction::MoveDown},
      {Key::ArrowLeft, NavAction::MoveLeft},
      {Key::A, NavAction::MoveLeft},
      {Key::ArrowRight, NavAction::MoveRight},
      {Key::D, NavAction::MoveRight},
      {Key::Equal, NavAction::ZoomIn},
      {Key::Minus, NavAction::ZoomOut},
      {Key::Comma, NavAction::PreviousElement},
      {Key::Period, NavAction::NextElement},
      {Key::Slash, NavAction::RecenterElement},
      {Key::Backslash, NavAction::ColorPick},
      {Key::Enter, NavAction::InsertElement},
  };
}

} // namespace Tessera
