#pragma once

#include <memory>

namespace Tessera {

class GLFWWindow;

// Window plus the Dear ImGui context bound to it.
class AppContext final {
public:
  explicit AppContext(std::unique_ptr<GLFWWindow> window);
  ~AppContext();

  AppContext(const AppContext &) = delete;
  AppContext &operator=(const AppContext &) = delete;

  GLFWWindow &window();

  void beginFrame();
  void endFrame();

  void imguiBegin();
  void imguiEnd();

private:
  void initImGui();
  void shutdownImGui();

private:
  std::unique_ptr<GLFWWindow> m_window;
};

} // namespace Tessera
