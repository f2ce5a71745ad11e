#pragma once

#include "KeyCodes.h"
#include <array>
#include <cstdint>

namespace Tessera {

struct InputState {
  static constexpr uint32_t MaxKeys = static_cast<uint32_t>(Key::Count);

  std::array<uint8_t, MaxKeys> down{};     // current raw
  std::array<uint8_t, MaxKeys> pressed{};  // edge this frame
  std::array<uint8_t, MaxKeys> released{}; // edge this frame

  double mouseX = 0.0;
  double mouseY = 0.0;

  void clearEdges() {
    pressed.fill(0);
    released.fill(0);
  }

  bool isDown(Key k) const { return down[idx(k)] != 0; }
  bool isPressed(Key k) const { return pressed[idx(k)] != 0; }
  bool isReleased(Key k) const { return released[idx(k)] != 0; }

  // Edge-tracking transitions, shared by the GLFW callbacks and tests.
  void press(Key k) {
    const uint32_t i = idx(k);
    if (!down[i])
      pressed[i] = 1;
    down[i] = 1;
  }
  void release(Key k) {
    const uint32_t i = idx(k);
    down[i] = 0;
    released[i] = 1;
  }

  // Release edges for everything still down (focus loss).
  void releaseAll() {
    for (uint32_t i = 0; i < MaxKeys; ++i) {
      if (down[i])
        released[i] = 1;
      down[i] = 0;
    }
  }

  static constexpr uint32_t idx(Key k) {
    return static_cast<uint32_t>(k);
  }
};

} // namespace Tessera
