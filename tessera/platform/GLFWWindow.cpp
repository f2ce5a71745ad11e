#include "GLFWWindow.h"

#include "core/Assert.h"
#include "core/Log.h"
#include "input/InputSystem.h"

#include <glad/glad.h>

#include <GLFW/glfw3.h>

#include <algorithm>

namespace Tessera {

static void glfwErrorCallback(int code, const char *msg) {
  Log::Error("GLFW error {}: {}", code, msg ? msg : "(null)");
}

GLFWWindow::GLFWWindow(const WindowDesc &desc) : m_title(desc.title) {
  glfwSetErrorCallback(glfwErrorCallback);
  TESSERA_ASSERT(glfwInit() == GLFW_TRUE, "glfwInit failed");

  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
  glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#if defined(__APPLE__)
  glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif

  m_window = glfwCreateWindow(desc.width, desc.height, m_title.c_str(),
                              nullptr, nullptr);
  TESSERA_ASSERT(m_window != nullptr, "glfwCreateWindow failed");
  glfwMakeContextCurrent(m_window);

  TESSERA_ASSERT(
      gladLoadGLLoader(reinterpret_cast<GLADloadproc>(glfwGetProcAddress)) != 0,
      "gladLoadGLLoader failed");
  glfwSwapInterval(desc.vsync ? 1 : 0);

  int fbW = 0, fbH = 0;
  glfwGetFramebufferSize(m_window, &fbW, &fbH);
  m_fbWidth = std::max(fbW, 1);
  m_fbHeight = std::max(fbH, 1);

  m_input = std::make_unique<InputSystem>(m_window);
  glfwSetWindowUserPointer(m_window, this);
  installCallbacks();

  Log::Info("Window {}x{}, OpenGL {}", m_fbWidth, m_fbHeight,
            reinterpret_cast<const char *>(glGetString(GL_VERSION)));
}

GLFWWindow::~GLFWWindow() {
  if (m_window)
    glfwDestroyWindow(m_window);
  glfwTerminate();
}

GLFWWindow *GLFWWindow::fromHandle(GLFWwindow *w) {
  return static_cast<GLFWWindow *>(glfwGetWindowUserPointer(w));
}

// Installed before ImGui's backend, which chains to them.
void GLFWWindow::installCallbacks() {
  glfwSetFramebufferSizeCallback(m_window, [](GLFWwindow *w, int fbW, int fbH) {
    if (auto *self = fromHandle(w)) {
      self->m_fbWidth = std::max(fbW, 1);
      self->m_fbHeight = std::max(fbH, 1);
    }
  });

  glfwSetKeyCallback(m_window,
                     [](GLFWwindow *w, int key, int, int action, int) {
                       if (auto *self = fromHandle(w))
                         self->m_input->onKey(key, action);
                     });

  glfwSetMouseButtonCallback(
      m_window, [](GLFWwindow *w, int button, int action, int) {
        if (auto *self = fromHandle(w))
          self->m_input->onMouseButton(button, action);
      });

  glfwSetCursorPosCallback(m_window, [](GLFWwindow *w, double x, double y) {
    if (auto *self = fromHandle(w))
      self->m_input->onCursorPos(x, y);
  });

  // Key-up events are not delivered to an unfocused window; without this a
  // held arrow key would keep the camera accelerating.
  glfwSetWindowFocusCallback(m_window, [](GLFWwindow *w, int focused) {
    if (auto *self = fromHandle(w); self && focused == GLFW_FALSE)
      self->m_input->onFocusLost();
  });
}

void GLFWWindow::pollEvents() { glfwPollEvents(); }

void GLFWWindow::waitEventsTimeout(double seconds) {
  glfwWaitEventsTimeout(seconds);
}

void GLFWWindow::swapBuffers() { glfwSwapBuffers(m_window); }

bool GLFWWindow::shouldClose() const {
  return glfwWindowShouldClose(m_window) == GLFW_TRUE;
}

bool GLFWWindow::isMinimized() const {
  return glfwGetWindowAttrib(m_window, GLFW_ICONIFIED) == GLFW_TRUE;
}

void GLFWWindow::setTitle(const std::string &title) {
  if (title == m_title)
    return;
  m_title = title;
  glfwSetWindowTitle(m_window, m_title.c_str());
}

double GLFWWindow::getTimeSeconds() const { return glfwGetTime(); }

} // namespace Tessera
