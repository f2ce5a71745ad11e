#include "InputSystem.h"

#include <GLFW/glfw3.h>

namespace Tessera {

InputSystem::InputSystem(GLFWwindow *window) : m_window(window) {
  TESSERA_ASSERT(m_window != nullptr, "InputSystem requires GLFWwindow*");
}

void InputSystem::endFrame() { m_state.clearEdges(); }

// --- mapping
Key InputSystem::mapGLFWKey(int key) {
  switch (key) {
  case GLFW_KEY_W:
    return Key::W;
  case GLFW_KEY_A:
    return Key::A;
  case GLFW_KEY_S:
    return Key::S;
  case GLFW_KEY_D:
    return Key::D;
  case GLFW_KEY_UP:
    return Key::ArrowUp;
  case GLFW_KEY_DOWN:
    return Key::ArrowDown;
  case GLFW_KEY_LEFT:
    return Key::ArrowLeft;
  case GLFW_KEY_RIGHT:
    return Key::ArrowRight;
  case GLFW_KEY_EQUAL:
    return Key::Equal;
  case GLFW_KEY_MINUS:
    return Key::Minus;
  case GLFW_KEY_COMMA:
    return Key::Comma;
  case GLFW_KEY_PERIOD:
    return Key::Period;
  case GLFW_KEY_SLASH:
    return Key::Slash;
  case GLFW_KEY_BACKSLASH:
    return Key::Backslash;
  case GLFW_KEY_ENTER:
  case GLFW_KEY_KP_ENTER:
    return Key::Enter;
  case GLFW_KEY_ESCAPE:
    return Key::Escape;
  case GLFW_KEY_DELETE:
    return Key::Delete;
  case GLFW_KEY_LEFT_SHIFT:
    return Key::LeftShift;
  case GLFW_KEY_RIGHT_SHIFT:
    return Key::RightShift;
  case GLFW_KEY_LEFT_CONTROL:
    return Key::LeftCtrl;
  case GLFW_KEY_RIGHT_CONTROL:
    return Key::RightCtrl;
  case GLFW_KEY_LEFT_ALT:
    return Key::LeftAlt;
  case GLFW_KEY_RIGHT_ALT:
    return Key::RightAlt;
  default:
    return Key::Unknown;
  }
}

Key InputSystem::mapGLFWMouseButton(int button) {
  switch (button) {
  case GLFW_MOUSE_BUTTON_LEFT:
    return Key::MouseLeft;
  case GLFW_MOUSE_BUTTON_RIGHT:
    return Key::MouseRight;
  case GLFW_MOUSE_BUTTON_MIDDLE:
    return Key::MouseMiddle;
  default:
    return Key::Unknown;
  }
}

void InputSystem::onKey(int key, int action) {
  const Key k = mapGLFWKey(key);
  if (k == Key::Unknown)
    return;

  if (action == GLFW_PRESS)
    m_state.press(k);
  else if (action == GLFW_RELEASE)
    m_state.release(k);
}

void InputSystem::onMouseButton(int button, int action) {
  const Key k = mapGLFWMouseButton(button);
  if (k == Key::Unknown)
    return;

  if (action == GLFW_PRESS)
    m_state.press(k);
  else if (action == GLFW_RELEASE)
    m_state.release(k);
}

void InputSystem::onCursorPos(double x, double y) {
  m_state.mouseX = x;
  m_state.mouseY = y;
}

} // namespace Tessera
