#pragma once

#include "core/Assert.h"
#include "InputState.h"

struct GLFWwindow;

namespace Tessera {

class InputSystem final {
public:
  explicit InputSystem(GLFWwindow *window);

  // Clears edges. Call only after a frame has consumed them; edges gathered
  // over skipped (minimized) frames stay for the next processed one.
  void endFrame();

  const InputState &state() const { return m_state; }

  bool isDown(Key k) const { return m_state.isDown(k); }
  bool isPressed(Key k) const { return m_state.isPressed(k); }
  bool isReleased(Key k) const { return m_state.isReleased(k); }

  void onKey(int key, int action);
  void onMouseButton(int button, int action);
  void onCursorPos(double x, double y);
  void onFocusLost() { m_state.releaseAll(); }

private:
  static Key mapGLFWKey(int key);
  static Key mapGLFWMouseButton(int button);

private:
  GLFWwindow *m_window = nullptr;
  InputState m_state{};
};

} // namespace Tessera
