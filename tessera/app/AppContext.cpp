#include "AppContext.h"

#include "core/Assert.h"
#include "core/Log.h"
#include "platform/GLFWWindow.h"

#include <glad/glad.h>
#include <GLFW/glfw3.h>

#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>
#include <imgui.h>

namespace Tessera {

AppContext::AppContext(std::unique_ptr<GLFWWindow> window)
    : m_window(std::move(window)) {
  TESSERA_ASSERT(m_window != nullptr, "AppContext requires a window");
  initImGui();
}

AppContext::~AppContext() { shutdownImGui(); }

GLFWWindow &AppContext::window() { return *m_window; }

void AppContext::beginFrame() { m_window->pollEvents(); }

void AppContext::endFrame() { m_window->swapBuffers(); }

void AppContext::initImGui() {
  IMGUI_CHECKVERSION();
  ImGui::CreateContext();

  ImGuiIO &io = ImGui::GetIO();
  // Keyboard nav would fight the arrow-key camera controls.
  io.ConfigFlags &= ~ImGuiConfigFlags_NavEnableKeyboard;
  io.IniFilename = "tessera_imgui.ini";

  ImGui::StyleColorsDark();

  GLFWwindow *w = m_window->handle();
  TESSERA_ASSERT(ImGui_ImplGlfw_InitForOpenGL(w, true),
                 "ImGui_ImplGlfw_InitForOpenGL failed");
  TESSERA_ASSERT(ImGui_ImplOpenGL3_Init("#version 330 core"),
                 "ImGui_ImplOpenGL3_Init failed");

  Log::Info("ImGui initialized");
}

void AppContext::shutdownImGui() {
  ImGui_ImplOpenGL3_Shutdown();
  ImGui_ImplGlfw_Shutdown();
  ImGui::DestroyContext();
}

void AppContext::imguiBegin() {
  glBindFramebuffer(GL_FRAMEBUFFER, 0);
  glViewport(0, 0, m_window->width(), m_window->height());
  glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
  glClear(GL_COLOR_BUFFER_BIT);

  ImGui_ImplOpenGL3_NewFrame();
  ImGui_ImplGlfw_NewFrame();
  ImGui::NewFrame();
}

void AppContext::imguiEnd() {
  ImGui::Render();
  ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
}

} // namespace Tessera
