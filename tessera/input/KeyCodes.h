#pragma once

#include <cstdint>

namespace Tessera {

enum class Key : uint16_t {
  Unknown = 0,
  W,
  A,
  S,
  D,
  ArrowUp,
  ArrowDown,
  ArrowLeft,
  ArrowRight,
  Equal,
  Minus,
  Comma,
  Period,
  Slash,
  Backslash,
  Enter,
  Escape,
  Delete,
  LeftShift,
  RightShift,
  LeftCtrl,
  RightCtrl,
  LeftAlt,
  RightAlt,
  MouseLeft,
  MouseRight,
  MouseMiddle, // treat as "keys" for now
  Count
};

} // namespace Tessera
