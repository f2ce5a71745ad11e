#pragma once

#include <cstdint>
#include <memory>
#include <string>

struct GLFWwindow;

namespace Tessera {

class InputSystem;

struct WindowDesc final {
  int32_t width = 1366;
  int32_t height = 768;
  std::string title = "Tessera";
  bool vsync = true;
};

// Window with a current GL 3.3 core context. Key, button, cursor and focus
// events land in the owned InputSystem.
class GLFWWindow final {
public:
  explicit GLFWWindow(const WindowDesc &desc);
  ~GLFWWindow();

  GLFWWindow(const GLFWWindow &) = delete;
  GLFWWindow &operator=(const GLFWWindow &) = delete;

  void pollEvents();
  void waitEventsTimeout(double seconds);
  void swapBuffers();

  bool shouldClose() const;
  bool isMinimized() const;

  // Only touches GLFW when the title actually changes.
  void setTitle(const std::string &title);

  // Framebuffer size in pixels, at least 1x1.
  int32_t width() const { return m_fbWidth; }
  int32_t height() const { return m_fbHeight; }
  GLFWwindow *handle() const { return m_window; }

  InputSystem &input() { return *m_input; }

  double getTimeSeconds() const;

private:
  static GLFWWindow *fromHandle(GLFWwindow *w);
  void installCallbacks();

  std::unique_ptr<InputSystem> m_input;
  GLFWwindow *m_window = nullptr;
  int32_t m_fbWidth = 1;
  int32_t m_fbHeight = 1;
  std::string m_title;
};

} // namespace Tessera
